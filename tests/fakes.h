#pragma once

/**
 * @file fakes.h
 * @brief Recording collaborators for deterministic tests
 *
 * Nothing here posts results on its own: a test decides when a transcript,
 * reply delta, synthesis or playback completion "arrives" and hands it to the
 * component under test (directly, or through the engine's event sink).
 */

#include "collaborators.h"
#include "remote_turn_predictor.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace turnkeeper {
namespace testing {

inline AudioHandle fake_audio(size_t samples = 1600) {
    return std::make_shared<const AudioBuffer>(samples, static_cast<Sample>(100));
}

inline bool contains_id(const std::vector<RequestId>& ids, RequestId id) {
    for (RequestId i : ids) {
        if (i == id) return true;
    }
    return false;
}

class FakeTranscriber : public ITranscriber {
public:
    void start(const RequestTicket& ticket) override { started.push_back(ticket); }
    void feed(RequestId id, const AudioFrame& frame) override { fed_samples[id] += frame.size(); }
    void finalize(RequestId id) override { finalized.push_back(id); }
    void cancel(RequestId id) override { canceled.push_back(id); }

    std::vector<RequestTicket> started;
    std::map<RequestId, size_t> fed_samples;
    std::vector<RequestId> finalized;
    std::vector<RequestId> canceled;
};

class FakeReplyGenerator : public IReplyGenerator {
public:
    struct Call {
        RequestTicket ticket;
        std::string user_text;
        ReplyHints hints;
    };

    void generate(const RequestTicket& ticket, const std::string& user_text,
                  const ReplyHints& hints) override {
        calls.push_back({ticket, user_text, hints});
    }
    void cancel(RequestId id) override { canceled.push_back(id); }

    std::vector<Call> calls;
    std::vector<RequestId> canceled;
};

class FakeSynthesizer : public ISynthesizer {
public:
    struct Call {
        RequestTicket ticket;
        SpeechChunk chunk;
    };

    void synthesize(const RequestTicket& ticket, const SpeechChunk& chunk) override {
        calls.push_back({ticket, chunk});
    }
    void cancel(RequestId id) override { canceled.push_back(id); }

    /// Request id of the synthesis for a chunk index (0 if never requested)
    RequestId request_for(uint32_t chunk_index) const {
        for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
            if (it->chunk.index == chunk_index) return it->ticket.id;
        }
        return 0;
    }

    std::vector<Call> calls;
    std::vector<RequestId> canceled;
};

class FakePlaybackDevice : public IPlaybackDevice {
public:
    struct Play {
        SessionId session;
        uint32_t chunk_index;
        std::string text;
    };

    void play(SessionId session, const SpeechChunk& chunk) override {
        plays.push_back({session, chunk.index, chunk.text});
        active = true;
        paused = false;
    }
    void pause() override { pauses++; paused = true; }
    void resume() override { resumes++; paused = false; }
    void stop() override { stops++; active = false; paused = false; }
    void set_volume(float v) override { volume = v; volume_changes++; }
    void play_cue(const std::string& phrase) override { cues.push_back(phrase); }

    std::vector<Play> plays;
    std::vector<std::string> cues;
    int pauses = 0;
    int resumes = 0;
    int stops = 0;
    int volume_changes = 0;
    float volume = 1.0f;
    bool active = false;
    bool paused = false;
};

/**
 * Keeps every request; answers only when a test posts a TurnPrediction.
 */
class FakeRemotePredictor : public IRemotePredictor {
public:
    struct Launch {
        RequestId id;
        DecisionInput input;
    };

    void launch(RequestId id, const DecisionInput& input, IEventSink&) override {
        launches.push_back({id, input});
    }

    std::vector<Launch> launches;
};

// =============================================================================
// Event builders
// =============================================================================

inline ReplyDelta reply_delta(const RequestTicket& ticket, const std::string& text, bool done = false) {
    ReplyDelta delta;
    delta.request = ticket.id;
    delta.session = ticket.session;
    delta.text = text;
    delta.done = done;
    return delta;
}

inline SynthesisReady synthesis_ready(const FakeSynthesizer::Call& call, AudioHandle audio = fake_audio()) {
    SynthesisReady ready;
    ready.request = call.ticket.id;
    ready.session = call.ticket.session;
    ready.chunk_index = call.chunk.index;
    ready.audio = audio;
    return ready;
}

inline PlaybackFinished playback_finished(SessionId session, uint32_t chunk_index) {
    PlaybackFinished finished;
    finished.session = session;
    finished.chunk_index = chunk_index;
    return finished;
}

inline TranscriptUpdate transcript(const RequestTicket& ticket, const std::string& text, bool is_final) {
    TranscriptUpdate update;
    update.request = ticket.id;
    update.session = ticket.session;
    update.utterance.text = text;
    update.utterance.is_final = is_final;
    return update;
}

inline CollaboratorFailure failure(const RequestTicket& ticket, ErrorType type = ErrorType::CollaboratorError,
                                   const std::string& message = "backend returned 500") {
    CollaboratorFailure f;
    f.request = ticket.id;
    f.session = ticket.session;
    f.kind = ticket.kind;
    f.error = make_error(type, message);
    return f;
}

inline TurnPrediction prediction(RequestId id, bool take_turn) {
    TurnPrediction p;
    p.request = id;
    TurnDecision decision;
    decision.take_turn = take_turn;
    decision.method = DecisionMethod::Fusion;
    decision.fused_score = take_turn ? 0.9f : 0.3f;
    decision.confidence = 0.8f;
    p.decision = decision;
    return p;
}

inline TurnPrediction prediction_failure(RequestId id) {
    TurnPrediction p;
    p.request = id;
    p.error = make_network_error("Couldn't connect to server");
    return p;
}

} // namespace testing
} // namespace turnkeeper
