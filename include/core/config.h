#pragma once

/**
 * @file config.h
 * @brief Unified engine configuration
 *
 * One struct per component, aggregated into EngineConfig. Supports:
 * - JSON file loading (missing keys keep their defaults)
 * - Saving the effective configuration back to JSON
 * - Validation at startup, including cross-component combinations
 */

#include "common.h"
#include "core/constants.h"
#include "errors.h"
#include <string>
#include <vector>

namespace turnkeeper {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Audio feature extractor / VAD
 */
struct FeatureConfig {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int tick_ms = constants::features::TICK_MS;
    float speaking_threshold = constants::features::SPEAKING_THRESHOLD;
    /// Threshold multiplier while assistant audio plays (acoustic leakage)
    float playback_threshold_multiplier = constants::features::PLAYBACK_THRESHOLD_MULTIPLIER;
    int pitch_window_samples = constants::features::PITCH_WINDOW_SAMPLES;
};

/**
 * @brief Fusion decision engine
 */
struct FusionConfig {
    float text_weight = constants::fusion::TEXT_WEIGHT;
    float threshold = constants::fusion::THRESHOLD;
    int fallback_threshold_ms = constants::fusion::FALLBACK_THRESHOLD_MS;
    bool enable_adaptation = false;     ///< Online weight nudging from feedback
    float adapt_step = constants::fusion::ADAPT_STEP;
    float min_text_weight = constants::fusion::MIN_TEXT_WEIGHT;
    float max_text_weight = constants::fusion::MAX_TEXT_WEIGHT;
};

/**
 * @brief Context-aware scaling of the fallback silence threshold
 */
struct ContextThresholdConfig {
    bool enabled = false;
    int min_threshold_ms = constants::fusion::MIN_FALLBACK_THRESHOLD_MS;
    int max_threshold_ms = constants::fusion::MAX_FALLBACK_THRESHOLD_MS;
};

/**
 * @brief Interruption classifier and barge-in
 */
struct InterruptionConfig {
    bool enabled = true;                ///< Classify bursts while the assistant speaks
    bool enable_pause_resume = true;    ///< Requires enabled
    int barge_in_threshold_ms = constants::interruption::BARGE_IN_THRESHOLD_MS;
    int backchannel_max_ms = constants::interruption::BACKCHANNEL_MAX_MS;
    float backchannel_max_intensity = constants::interruption::BACKCHANNEL_MAX_INTENSITY;
    float interruption_min_intensity = constants::interruption::INTERRUPTION_MIN_INTENSITY;
    float nasal_min_hz = constants::interruption::NASAL_MIN_HZ;
    float nasal_max_hz = constants::interruption::NASAL_MAX_HZ;
    int impatience_count = constants::interruption::IMPATIENCE_COUNT;
    int impatience_window_ms = constants::interruption::IMPATIENCE_WINDOW_MS;
    int min_utterance_ms = constants::interruption::MIN_UTTERANCE_MS;
    int paused_min_utterance_ms = constants::interruption::PAUSED_MIN_UTTERANCE_MS;
    std::vector<std::string> backchannel_lexicon = {
        "mm", "mhm", "mm-hmm", "mmhmm", "uh-huh", "uh huh", "huh", "uh",
        "yeah", "yep", "yes", "okay", "ok", "right", "sure", "i see", "got it"
    };
};

/**
 * @brief Reply segmentation into speakable chunks
 */
struct ChunkerConfig {
    int min_chars = constants::chunker::MIN_CHARS;
    int max_chars = constants::chunker::MAX_CHARS;
    int force_after_ms = constants::chunker::FORCE_AFTER_MS;
};

/**
 * @brief Playback session behaviour
 */
struct PlaybackConfig {
    /// Also synthesize the whole reply in one request; used only if it lands before chunked playback starts
    bool full_reply_fallback = false;
    int collaborator_timeout_ms = constants::playback::COLLABORATOR_TIMEOUT_MS;
};

/**
 * @brief Output volume ducking while the user speaks
 */
struct DuckingConfig {
    bool enabled = true;
    float silence_volume = constants::ducking::SILENCE_VOLUME;
    float backchannel_volume = constants::ducking::BACKCHANNEL_VOLUME;
    float tentative_volume = constants::ducking::TENTATIVE_VOLUME;
    float clear_volume = constants::ducking::CLEAR_VOLUME;
    float step_per_tick = constants::ducking::STEP_PER_TICK;
    int clear_min_ms = constants::ducking::CLEAR_MIN_MS;
    int backchannel_max_ms = constants::interruption::BACKCHANNEL_MAX_MS;
    float backchannel_max_intensity = constants::interruption::BACKCHANNEL_MAX_INTENSITY;
};

/**
 * @brief Assistant acknowledgments while the user holds the floor
 */
struct BackchannelConfig {
    bool enabled = false;
    int min_user_speech_ms = constants::backchannel::MIN_USER_SPEECH_MS;
    int min_interval_ms = constants::backchannel::MIN_INTERVAL_MS;
    int inhibit_ms = constants::backchannel::INHIBIT_MS;
    std::vector<std::string> phrases = {"mm-hmm", "yeah", "right", "I see"};
};

/**
 * @brief Remotely hosted turn prediction (turn-prediction endpoint contract)
 */
struct RemotePredictorConfig {
    bool enabled = false;
    std::string endpoint = "http://localhost:3001/api/turn-prediction";
    int timeout_ms = constants::remote::TIMEOUT_MS;
    int connect_timeout_ms = constants::remote::CONNECT_TIMEOUT_MS;
    int retry_backoff_ms = constants::remote::RETRY_BACKOFF_MS;
};

/**
 * @brief Capture/playback devices (CLI only)
 */
struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = DEFAULT_SAMPLE_RATE;
};

/**
 * @brief Speech/chat backend used by the CLI collaborators
 *
 * POST {base_url}/api/stt (multipart WAV), /api/chat, /api/tts.
 */
struct BackendConfig {
    std::string base_url = "http://localhost:3001";
    int timeout_ms = 60000;
    int partial_interval_ms = 600;  ///< Re-transcribe the growing utterance this often; 0 = final only
    std::string system_prompt;      ///< Empty = backend default
};

struct LoggingConfig {
    std::string level = "info";     ///< debug | info | warn | error
    std::string file;               ///< Empty = console only
    std::string record_dir;         ///< Empty = no decision recording
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete engine configuration
 */
struct EngineConfig {
    FeatureConfig features;
    FusionConfig fusion;
    ContextThresholdConfig context_threshold;
    InterruptionConfig interruption;
    ChunkerConfig chunker;
    PlaybackConfig playback;
    DuckingConfig ducking;
    BackchannelConfig backchannel;
    RemotePredictorConfig remote;
    AudioConfig audio;
    BackendConfig backend;
    LoggingConfig logging;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded and validated config, or ParseError/InvalidConfig
     */
    static Result<EngineConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from a JSON document string
     */
    static Result<EngineConfig> parse(const std::string& json_text);

    /**
     * @brief Save configuration to JSON file
     */
    Result<void> save(const std::string& path) const;

    /**
     * @brief Serialize to a pretty-printed JSON string
     */
    std::string to_json_string() const;

    /**
     * @brief Create with default values
     */
    static EngineConfig defaults();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

using EngineConfig = config::EngineConfig;

} // namespace turnkeeper
