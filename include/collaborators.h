#pragma once

/**
 * @file collaborators.h
 * @brief External services the engine drives, and the events they post back
 *
 * Transcription, reply generation, synthesis and audio output run outside
 * the tick loop. Each request carries a RequestTicket; results come back as
 * CollaboratorEvents posted to the engine's EventInbox from any thread.
 */

#include "cancellation.h"
#include "core/types.h"
#include "errors.h"
#include <optional>
#include <string>
#include <variant>

namespace turnkeeper {

// =============================================================================
// Events
// =============================================================================

struct TranscriptUpdate {
    RequestId request = 0;
    SessionId session = 0;
    Utterance utterance;            ///< is_final marks the finalized transcript
};

struct ReplyDelta {
    RequestId request = 0;
    SessionId session = 0;
    std::string text;
    bool done = false;              ///< No more text will follow
};

struct SynthesisReady {
    RequestId request = 0;
    SessionId session = 0;
    uint32_t chunk_index = 0;
    AudioHandle audio;
};

struct PlaybackFinished {
    SessionId session = 0;
    uint32_t chunk_index = 0;
};

struct CollaboratorFailure {
    RequestId request = 0;
    SessionId session = 0;
    RequestKind kind = RequestKind::Reply;
    Error error;
};

/**
 * @brief Answer from the remote turn predictor
 */
struct TurnPrediction {
    RequestId request = 0;
    std::optional<TurnDecision> decision;   ///< Empty when the request failed
    Error error;
};

using CollaboratorEvent = std::variant<TranscriptUpdate, ReplyDelta, SynthesisReady,
                                       PlaybackFinished, CollaboratorFailure, TurnPrediction>;

/**
 * @brief Where collaborators deliver results
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void post(CollaboratorEvent event) = 0;
};

// =============================================================================
// Collaborator interfaces
// =============================================================================

/**
 * @brief Streaming speech-to-text
 *
 * Posts partial and final TranscriptUpdate events.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;
    virtual void start(const RequestTicket& ticket) = 0;
    virtual void feed(RequestId id, const AudioFrame& frame) = 0;
    virtual void finalize(RequestId id) = 0;
    virtual void cancel(RequestId id) = 0;
};

struct ReplyHints {
    bool prefer_concise = false;    ///< User is impatient
};

/**
 * @brief Chat completion; posts ReplyDelta events, the last with done = true
 */
class IReplyGenerator {
public:
    virtual ~IReplyGenerator() = default;
    virtual void generate(const RequestTicket& ticket, const std::string& user_text,
                          const ReplyHints& hints) = 0;
    virtual void cancel(RequestId id) = 0;
};

/**
 * @brief Text-to-speech; posts SynthesisReady or CollaboratorFailure
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;
    virtual void synthesize(const RequestTicket& ticket, const SpeechChunk& chunk) = 0;
    virtual void cancel(RequestId id) = 0;
};

/**
 * @brief Assistant audio output; posts PlaybackFinished when a chunk ends
 *
 * stop() discards the chunk in progress without posting PlaybackFinished.
 */
class IPlaybackDevice {
public:
    virtual ~IPlaybackDevice() = default;
    virtual void play(SessionId session, const SpeechChunk& chunk) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;
    virtual void set_volume(float volume) = 0;

    /**
     * @brief Short acknowledgment sound, mixed over nothing else
     */
    virtual void play_cue(const std::string& phrase) = 0;
};

/**
 * @brief Microphone
 */
class ICaptureDevice {
public:
    virtual ~ICaptureDevice() = default;

    /**
     * @brief Take whatever audio arrived since the last call
     * @return False if the device has failed or closed
     */
    virtual bool read_frame(AudioFrame& frame) = 0;
};

} // namespace turnkeeper
