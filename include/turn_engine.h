#pragma once

/**
 * @file turn_engine.h
 * @brief Turn-taking orchestrator
 *
 * One tick per analysis interval, on one thread:
 * 1. Drain collaborator results from the inbox
 * 2. Extract features from the audio pushed since the last tick
 * 3. Classify speech that overlaps assistant playback (barge-in, pause)
 * 4. Duck the assistant, maybe play a backchannel cue
 * 5. Feed the transcriber and decide whether the user's turn is over
 * 6. Time out stalled collaborator requests
 */

#include "cancellation.h"
#include "collaborators.h"
#include "core/config.h"
#include "core/types.h"
#include "fusion_engine.h"
#include "playback_session.h"
#include "remote_turn_predictor.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace turnkeeper {

class DecisionRecorder;

enum class EngineStatus {
    Listening,
    UserSpeaking,
    Thinking,       ///< Reply requested, nothing audible yet
    Speaking,
    Paused
};

inline const char* engine_status_to_string(EngineStatus status) {
    switch (status) {
        case EngineStatus::Listening: return "listening";
        case EngineStatus::UserSpeaking: return "user_speaking";
        case EngineStatus::Thinking: return "thinking";
        case EngineStatus::Speaking: return "speaking";
        case EngineStatus::Paused: return "paused";
    }
    return "unknown";
}

/**
 * @brief Collaborators the engine drives; must outlive the engine
 */
struct EngineCollaborators {
    ITranscriber* transcriber = nullptr;
    IReplyGenerator* reply_generator = nullptr;
    ISynthesizer* synthesizer = nullptr;
    IPlaybackDevice* device = nullptr;
};

/**
 * @brief Everything the engine knows about the conversation
 *
 * Owned by the engine; handlers receive it by reference.
 */
struct ConversationState {
    std::unique_ptr<PlaybackSession> session;    ///< Current reply, null between replies
    ConversationContext context;
    Utterance transcript;                        ///< User turn in progress
    SessionId pending_session = 1;               ///< Session the next reply will get
    int turn_number = 0;                         ///< Replies requested so far
    std::optional<RequestId> transcription;      ///< Transcription of the turn in progress
    bool finalizing = false;
    int64_t utterance_ms = 0;                    ///< Speech heard in the turn in progress
    bool ignore_burst = false;                   ///< Current burst was consumed (cue or command)
    bool impatient = false;                      ///< Next reply should be concise
    std::optional<TurnDecision> last_decision;
};

/**
 * @brief What happened on one tick
 */
struct TickReport {
    AudioFeatures features;
    std::optional<TurnDecision> decision;
    std::vector<InterruptionEvent> interruptions;
    std::optional<std::string> backchannel;
    float volume = 1.0f;
    EngineStatus status = EngineStatus::Listening;
};

class TurnEngine {
public:
    /**
     * @param remote Asked alongside the fusion engine; null selects the HTTP
     *        predictor when remote.enabled, nothing otherwise
     */
    TurnEngine(const EngineConfig& config, EngineCollaborators collaborators,
               std::unique_ptr<IRemotePredictor> remote = nullptr);
    ~TurnEngine();

    TurnEngine(const TurnEngine&) = delete;
    TurnEngine& operator=(const TurnEngine&) = delete;

    /**
     * @brief Where collaborators post their results (thread-safe)
     */
    IEventSink& events();

    /**
     * @brief Queue captured audio for the next tick
     */
    void push_audio(const AudioFrame& frame);

    /**
     * @brief Run one analysis tick
     */
    TickReport tick(TimePoint now = Clock::now());

    /**
     * @brief Capture, tick and sleep until shutdown()
     * @return 0 on shutdown, 1 if the capture device failed
     */
    int run(ICaptureDevice& capture);

    /**
     * @brief Stop run() (thread-safe)
     */
    void shutdown();

    /**
     * @brief Was the last turn decision right? Adapts fusion weights when enabled
     */
    void feedback(bool was_correct);

    /// Optional; must outlive the engine
    void set_recorder(DecisionRecorder* recorder);

    EngineStatus status() const;
    const ConversationState& state() const;
    const TicketRegistry& tickets() const;
    FusionEngine& fusion();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace turnkeeper
