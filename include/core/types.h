#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the turn-taking engine
 *
 * Every structure crossing a component boundary lives here so that the
 * scorers, classifier and playback session agree on one vocabulary.
 */

#include "common.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace turnkeeper {

// =============================================================================
// Audio analysis
// =============================================================================

/**
 * @brief Prosodic snapshot produced once per analysis tick
 */
struct AudioFeatures {
    int64_t silence_duration_ms = 0;   ///< Grows by the tick while silent, 0 while speaking
    float intensity_rms = 0.0f;        ///< [0,1]
    float pitch_trend = 0.0f;          ///< [-1,1], falling -> rising
    float speaking_rate_hz = 0.0f;     ///< Syllables per second proxy
    bool is_speaking = false;
    int64_t speech_duration_ms = 0;    ///< Length of the current continuous burst, 0 when silent
    float dominant_frequency_hz = 0.0f;///< Zero-crossing frequency estimate
};

/**
 * @brief Live transcript of the current user turn (read-only for the scorers)
 */
struct Utterance {
    std::string text;
    bool is_final = false;
    TimePoint started_at{};
};

// =============================================================================
// Turn decisions
// =============================================================================

enum class DecisionMethod {
    Fusion,
    Fallback
};

inline const char* decision_method_to_string(DecisionMethod method) {
    // Wire names from the turn-prediction endpoint contract
    return method == DecisionMethod::Fusion ? "fusion" : "simple_threshold";
}

/**
 * @brief Hold/shift probabilities from the prosody scorer (sum to 1)
 */
struct ProsodyPrediction {
    float hold = 0.5f;
    float shift = 0.5f;
};

struct DecisionBreakdown {
    float trp = 0.0f;
    float vap_shift = 0.0f;
    float vap_hold = 0.0f;
    float text_weight = 0.0f;
    float audio_weight = 0.0f;
    int64_t silence_duration_ms = 0;   ///< Fallback only
    int64_t threshold_ms = 0;          ///< Fallback only
};

/**
 * @brief One decision tick's verdict. Superseded, never mutated.
 */
struct TurnDecision {
    float text_score = 0.0f;
    float audio_score = 0.0f;
    float fused_score = 0.0f;
    float confidence = 0.0f;
    bool take_turn = false;
    DecisionMethod method = DecisionMethod::Fallback;
    DecisionBreakdown breakdown;
};

// =============================================================================
// Interruptions
// =============================================================================

enum class InterruptionType {
    None,
    Backchannel,
    Interruption,
    Pause,
    Correction,
    TopicShift,
    Impatience
};

inline const char* interruption_type_to_string(InterruptionType type) {
    switch (type) {
        case InterruptionType::None: return "NONE";
        case InterruptionType::Backchannel: return "BACKCHANNEL";
        case InterruptionType::Interruption: return "INTERRUPTION";
        case InterruptionType::Pause: return "PAUSE";
        case InterruptionType::Correction: return "CORRECTION";
        case InterruptionType::TopicShift: return "TOPIC_SHIFT";
        case InterruptionType::Impatience: return "IMPATIENCE";
    }
    return "UNKNOWN";
}

/// True for the classifications that end the current playback session
inline bool aborts_playback(InterruptionType type) {
    return type == InterruptionType::Interruption ||
           type == InterruptionType::Correction ||
           type == InterruptionType::TopicShift;
}

struct InterruptionEvent {
    InterruptionType type = InterruptionType::None;
    float confidence = 0.0f;
    std::optional<uint32_t> during_chunk;  ///< Chunk playing when the burst occurred
    std::string reason;
};

// =============================================================================
// Playback
// =============================================================================

/// Opaque playable audio produced by the synthesis collaborator
using AudioHandle = std::shared_ptr<const AudioBuffer>;

struct SpeechChunk {
    uint32_t index = 0;
    std::string text;
    AudioHandle audio;
    bool is_final = false;
};

enum class PlaybackState {
    Idle,       ///< Session created, nothing audible yet
    Playing,
    Paused,
    Aborted,    ///< Terminal
    Completed   ///< Terminal, final chunk finished
};

inline const char* playback_state_to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle: return "IDLE";
        case PlaybackState::Playing: return "PLAYING";
        case PlaybackState::Paused: return "PAUSED";
        case PlaybackState::Aborted: return "ABORTED";
        case PlaybackState::Completed: return "COMPLETED";
    }
    return "UNKNOWN";
}

inline bool is_terminal(PlaybackState state) {
    return state == PlaybackState::Aborted || state == PlaybackState::Completed;
}

// =============================================================================
// Conversation-wide counters
// =============================================================================

/**
 * @brief Rolling counters shared across components
 *
 * Written only by the InterruptionClassifier and BackchannelScheduler.
 */
struct ConversationContext {
    int consecutive_interruptions = 0;
    std::optional<TimePoint> last_interruption;
    std::optional<TimePoint> last_backchannel;
    int total_interruptions = 0;
};

} // namespace turnkeeper
