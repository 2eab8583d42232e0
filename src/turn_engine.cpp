#include "turn_engine.h"
#include "backchannel_scheduler.h"
#include "context_threshold.h"
#include "decision_recorder.h"
#include "ducking_controller.h"
#include "event_inbox.h"
#include "interruption_classifier.h"
#include "logger.h"
#include "remote_turn_predictor.h"
#include "utils.h"
#include "vad/feature_extractor.h"
#include <atomic>
#include <deque>
#include <sstream>
#include <thread>

namespace turnkeeper {

namespace {

/// RMS values kept for the noise estimate (about one second of ticks)
constexpr size_t RMS_HISTORY = 20;

} // namespace

class TurnEngine::Impl {
public:
    Impl(const EngineConfig& config, EngineCollaborators collaborators,
         std::unique_ptr<IRemotePredictor> remote)
        : config_(config),
          collab_(collaborators),
          extractor_(config.features),
          classifier_(config.interruption),
          fusion_(std::make_unique<FusionEngine>(config.fusion)),
          threshold_(config.fusion.fallback_threshold_ms, config.context_threshold),
          ducking_(config.ducking),
          backchannel_(config.backchannel, collaborators.device),
          running_(false) {
        if (remote) {
            remote_ = std::move(remote);
        } else if (config_.remote.enabled) {
            remote_ = std::make_unique<RemoteTurnPredictor>(config_.remote);
            LOG_ENGINE("Turn decisions from " + config_.remote.endpoint);
        }
    }

    ~Impl() {
        if (state_.session && !state_.session->is_finished()) {
            state_.session->abort("engine shutdown");
        }
        drop_utterance("engine shutdown");
    }

    IEventSink& events() { return inbox_; }

    void push_audio(const AudioFrame& frame) {
        extractor_.push(frame);
        tick_audio_.insert(tick_audio_.end(), frame.begin(), frame.end());
    }

    TickReport tick(TimePoint now) {
        TickReport report;

        // 1. Collaborator results
        for (auto& event : inbox_.drain()) {
            std::visit([&](auto& e) { handle(e, now); }, event);
        }
        observe_session();

        // 2. Features; leakage only while a chunk is actually on the device
        AudioFeatures features = extractor_.tick(assistant_audible());
        report.features = features;
        rms_history_.push_back(features.intensity_rms);
        if (rms_history_.size() > RMS_HISTORY) {
            rms_history_.pop_front();
        }

        // 3. Overlap classification, including gaps between chunks
        if (assistant_playing() && config_.interruption.enabled) {
            std::optional<std::string> partial;
            if (state_.transcription && !utils::is_empty_or_whitespace(state_.transcript.text)) {
                partial = state_.transcript.text;
            }
            report.interruptions = classifier_.observe(features, partial,
                                                       state_.session->current_chunk(),
                                                       state_.context, now);
            for (const auto& event : report.interruptions) {
                handle_interruption(event);
            }
            observe_session();
        }

        // 4. Ducking and backchannels
        if (state_.session && !state_.session->is_finished()) {
            float volume = ducking_.update(features);
            if (volume != state_.session->volume()) {
                state_.session->set_volume(volume);
            }
            report.volume = volume;
        }
        report.backchannel = backchannel_.tick(features, assistant_playing(), state_.finalizing,
                                               state_.context, now);

        // 5. User turn
        process_user_speech(features, now, report);

        // 6. Stalled requests
        check_timeouts(now);
        observe_session();

        tick_audio_.clear();
        report.status = status();
        return report;
    }

    int run(ICaptureDevice& capture) {
        running_ = true;
        LOG_ENGINE("=== Turnkeeper started, listening ===");

        const Duration tick_interval(config_.features.tick_ms);
        TimePoint next_tick = Clock::now() + tick_interval;
        AudioFrame frame;
        EngineStatus last_status = EngineStatus::Listening;

        while (running_) {
            if (!capture.read_frame(frame)) {
                Logger::error("Capture device failed, stopping");
                running_ = false;
                return 1;
            }
            if (!frame.empty()) {
                push_audio(frame);
            }

            TimePoint now = Clock::now();
            if (now >= next_tick) {
                TickReport report = tick(now);
                if (report.status != last_status) {
                    LOG_ENGINE(std::string("Status: ") + engine_status_to_string(report.status));
                    last_status = report.status;
                }
                next_tick += tick_interval;
                if (next_tick < now) {
                    // Fell behind; do not burst ticks
                    next_tick = now + tick_interval;
                }
            }
            std::this_thread::sleep_for(Duration(2));
        }
        return 0;
    }

    void shutdown() { running_ = false; }

    void feedback(bool was_correct) {
        if (!config_.fusion.enable_adaptation || !state_.last_decision) {
            return;
        }
        fusion_->update_weights(was_correct, *state_.last_decision);
    }

    void set_recorder(DecisionRecorder* recorder) { recorder_ = recorder; }

    EngineStatus status() const {
        if (state_.session && !state_.session->is_finished()) {
            switch (state_.session->state()) {
                case PlaybackState::Paused: return EngineStatus::Paused;
                case PlaybackState::Playing: return EngineStatus::Speaking;
                default: return EngineStatus::Thinking;
            }
        }
        if (state_.finalizing) {
            return EngineStatus::Thinking;
        }
        if (state_.transcription) {
            return EngineStatus::UserSpeaking;
        }
        return EngineStatus::Listening;
    }

    const ConversationState& state() const { return state_; }
    const TicketRegistry& tickets() const { return registry_; }
    FusionEngine& fusion() { return *fusion_; }

private:
    bool assistant_audible() const {
        return state_.session && state_.session->is_audible();
    }

    /// Reply in progress, even while the next chunk is still synthesizing
    bool assistant_playing() const {
        return state_.session && state_.session->state() == PlaybackState::Playing;
    }

    bool assistant_paused() const {
        return state_.session && state_.session->state() == PlaybackState::Paused;
    }

    // =========================================================================
    // Collaborator events
    // =========================================================================

    PlaybackSession* route(SessionId session, const char* what) {
        if (state_.session && state_.session->id() == session && !state_.session->is_finished()) {
            return state_.session.get();
        }
        LOG_DEBUG(std::string("[") + error_type_to_string(ErrorType::CancellationRace) +
                  "] Discarding " + what + " for superseded session " + std::to_string(session));
        return nullptr;
    }

    void handle(TranscriptUpdate& update, TimePoint now) {
        if (!state_.transcription || *state_.transcription != update.request ||
            !registry_.find(update.request, state_.pending_session)) {
            LOG_DEBUG(std::string("[") + error_type_to_string(ErrorType::CancellationRace) +
                      "] Discarding transcript for request " + std::to_string(update.request));
            return;
        }
        registry_.touch(update.request, now);
        state_.transcript.text = update.utterance.text;
        state_.transcript.is_final = update.utterance.is_final;

        if (!update.utterance.is_final) {
            LOG_DEBUG("Partial transcript: \"" + update.utterance.text + "\"");
            return;
        }

        registry_.retire(update.request);
        std::string text = utils::trim_copy(update.utterance.text);
        state_.transcription.reset();
        state_.finalizing = false;
        state_.utterance_ms = 0;
        on_final_transcript(text, now);
    }

    void handle(ReplyDelta& delta, TimePoint now) {
        PlaybackSession* session = route(delta.session, "reply text");
        if (!session) return;
        if (!registry_.find(delta.request, delta.session)) {
            LOG_DEBUG("Discarding reply text for retired request " + std::to_string(delta.request));
            return;
        }
        registry_.touch(delta.request, now);
        session->on_reply_delta(delta, now);
    }

    void handle(SynthesisReady& ready, TimePoint) {
        PlaybackSession* session = route(ready.session, "synthesized audio");
        if (session) {
            session->on_synthesis_ready(ready);
        }
    }

    void handle(PlaybackFinished& finished, TimePoint) {
        PlaybackSession* session = route(finished.session, "playback completion");
        if (session) {
            session->on_playback_finished(finished);
        }
    }

    void handle(CollaboratorFailure& failure, TimePoint) {
        if (failure.kind == RequestKind::Transcription) {
            if (state_.transcription && *state_.transcription == failure.request) {
                Logger::warn("[Engine] Transcription failed: " + failure.error.to_string());
                drop_utterance("transcription failed");
            } else {
                LOG_DEBUG("Discarding late transcription failure " + std::to_string(failure.request));
            }
            return;
        }
        PlaybackSession* session = route(failure.session, "failure");
        if (session && session->on_failure(failure)) {
            classifier_.reset_burst();
            LOG_ENGINE("Reply abandoned, back to listening");
        }
    }

    void handle(TurnPrediction& prediction, TimePoint now) {
        if (!prediction_.in_flight || *prediction_.in_flight != prediction.request) {
            LOG_DEBUG("Discarding stale turn prediction " + std::to_string(prediction.request));
            return;
        }
        prediction_.in_flight.reset();
        if (!prediction.decision) {
            prediction_failed(prediction.error, now);
            return;
        }
        if (prediction_.failures > 0) {
            LOG_REMOTE("Turn prediction endpoint recovered");
        }
        prediction_.failures = 0;
        if (state_.transcription && prediction_.transcription == *state_.transcription &&
            !state_.finalizing) {
            prediction_.answer = prediction.decision;
        }
    }

    // =========================================================================
    // Barge-in
    // =========================================================================

    void handle_interruption(const InterruptionEvent& event) {
        if (!state_.session) return;
        if (recorder_) {
            recorder_->record_interruption(state_.session->id(), event);
        }

        switch (event.type) {
            case InterruptionType::Backchannel:
                // Playback continues; the acknowledgment is not a turn
                drop_utterance("backchannel");
                state_.ignore_burst = true;
                break;
            case InterruptionType::Pause:
                if (config_.interruption.enable_pause_resume) {
                    pause_playback(event);
                } else {
                    barge_in(event);
                }
                break;
            case InterruptionType::Interruption:
            case InterruptionType::Correction:
            case InterruptionType::TopicShift:
                barge_in(event);
                break;
            case InterruptionType::Impatience:
                state_.impatient = true;
                LOG_BARGE("User is impatient, next reply will be concise");
                break;
            case InterruptionType::None:
                break;
        }
    }

    void pause_playback(const InterruptionEvent& event) {
        Result<void> result = state_.session->pause();
        if (!result) {
            Logger::warn("[Barge] " + result.error().to_string());
            return;
        }
        std::ostringstream oss;
        oss << "Paused (" << event.reason << "), remaining: \""
            << state_.session->remaining_text() << "\"";
        LOG_BARGE(oss.str());
        // The command itself is not a request
        drop_utterance("pause command");
        state_.ignore_burst = true;
    }

    void barge_in(const InterruptionEvent& event) {
        std::ostringstream oss;
        oss << interruption_type_to_string(event.type) << " (" << event.reason
            << ", confidence " << event.confidence << ")";
        LOG_BARGE(oss.str());
        state_.session->abort(interruption_type_to_string(event.type));
        classifier_.reset_burst();
        // The user's speech keeps being transcribed and becomes the next turn
    }

    // =========================================================================
    // User turn
    // =========================================================================

    void process_user_speech(const AudioFeatures& features, TimePoint now, TickReport& report) {
        bool playing = assistant_playing();

        if (features.is_speaking) {
            if (!state_.transcription && !state_.ignore_burst) {
                // Half-duplex when classification is off: no turns over playback
                if (!playing || config_.interruption.enabled) {
                    start_transcription(now);
                }
            }
            if (state_.transcription && !state_.finalizing) {
                state_.utterance_ms += config_.features.tick_ms;
            }
            // Anything the remote predictor says now describes an earlier silence
            forget_prediction();
        } else {
            state_.ignore_burst = false;
        }

        if (state_.transcription && !state_.finalizing && !tick_audio_.empty() &&
            !backchannel_.inhibiting(now) && collab_.transcriber) {
            collab_.transcriber->feed(*state_.transcription, tick_audio_);
            registry_.touch(*state_.transcription, now);
        }

        if (!state_.transcription || state_.finalizing || features.is_speaking) {
            return;
        }

        if (playing) {
            // Burst ended over playback without claiming the floor
            drop_utterance("overlap without a floor claim");
            return;
        }

        TurnDecision decision = decide(features, now);
        report.decision = decision;
        state_.last_decision = decision;
        if (!decision.take_turn) {
            return;
        }

        if (state_.utterance_ms < classifier_.min_utterance_ms(assistant_paused())) {
            drop_utterance("utterance too short (" + std::to_string(state_.utterance_ms) + "ms)");
            return;
        }

        if (recorder_) {
            recorder_->record_decision(state_.pending_session, state_.transcript.text, decision);
        }
        std::ostringstream oss;
        oss << "End of turn (" << decision_method_to_string(decision.method)
            << ", fused=" << decision.fused_score << "), finalizing transcript";
        LOG_ENGINE(oss.str());
        state_.finalizing = true;
        registry_.touch(*state_.transcription, now);
        if (collab_.transcriber) {
            collab_.transcriber->finalize(*state_.transcription);
        }
    }

    TurnDecision decide(const AudioFeatures& features, TimePoint now) {
        int64_t silence = features.silence_duration_ms;
        int threshold = current_threshold();

        // Silence past the ceiling ends the turn whatever the text says
        if (silence >= config_.context_threshold.max_threshold_ms) {
            return FusionEngine::decide_fallback(silence, threshold);
        }

        DecisionInput input;
        if (!utils::is_empty_or_whitespace(state_.transcript.text)) {
            input.transcript = state_.transcript.text;
        }
        input.features = features;
        input.silence_duration_ms = silence;
        input.fallback_threshold_ms = threshold;
        if (!remote_) {
            return fusion_->decide(input);
        }

        std::optional<TurnDecision> answer = std::move(prediction_.answer);
        prediction_.answer.reset();
        if (answer && answer->take_turn) {
            return *answer;
        }
        request_prediction(input, now);
        return answer ? *answer : fusion_->decide(input);
    }

    /**
     * @brief Keep one remote request in flight, backing off after failures
     */
    void request_prediction(const DecisionInput& input, TimePoint now) {
        if (prediction_.in_flight) {
            int64_t limit = config_.remote.timeout_ms + config_.remote.connect_timeout_ms;
            if (ms_between(prediction_.launched_at, now) <= limit) {
                return;
            }
            prediction_.in_flight.reset();
            prediction_failed(make_timeout_error("turn-prediction unanswered after " +
                                                 std::to_string(limit) + "ms"), now);
        }
        if (now < prediction_.retry_at) {
            return;
        }
        RequestId id = prediction_.next_id++;
        prediction_.in_flight = id;
        prediction_.launched_at = now;
        prediction_.transcription = *state_.transcription;
        remote_->launch(id, input, inbox_);
    }

    void prediction_failed(const Error& error, TimePoint now) {
        prediction_.failures++;
        prediction_.retry_at = now + Duration(config_.remote.retry_backoff_ms);
        // Log the first failure of a streak only
        if (prediction_.failures == 1) {
            Logger::warn("[Remote] " + error.to_string() + ", deciding locally for " +
                         std::to_string(config_.remote.retry_backoff_ms) + "ms");
        }
    }

    void forget_prediction() {
        prediction_.in_flight.reset();
        prediction_.answer.reset();
    }

    int current_threshold() {
        if (!config_.context_threshold.enabled) {
            return config_.fusion.fallback_threshold_ms;
        }
        ThresholdContext context;
        const std::string& text = state_.transcript.text;
        if (!utils::is_empty_or_whitespace(text)) {
            context.is_question = ContextAwareThreshold::is_question(text);
            context.transcript_length = text.size();
            context.words_per_second = ContextAwareThreshold::estimate_speaking_rate(
                text, state_.utterance_ms);
        }
        context.turn_number = state_.turn_number;
        context.noise_level = ContextAwareThreshold::estimate_noise_level(
            std::vector<float>(rms_history_.begin(), rms_history_.end()));
        if (state_.turn_number > 0) {
            context.interruption_rate = static_cast<float>(state_.context.total_interruptions) /
                                        static_cast<float>(state_.turn_number);
        }
        return threshold_.calculate(context);
    }

    void start_transcription(TimePoint now) {
        if (!collab_.transcriber) return;
        RequestTicket ticket = registry_.issue(state_.pending_session, RequestKind::Transcription,
                                               std::nullopt, now);
        state_.transcription = ticket.id;
        state_.transcript = Utterance{};
        state_.transcript.started_at = now;
        state_.utterance_ms = 0;
        state_.finalizing = false;
        forget_prediction();
        collab_.transcriber->start(ticket);
        LOG_DEBUG("Transcription " + std::to_string(ticket.id) + " started");
    }

    void drop_utterance(const std::string& reason) {
        if (!state_.transcription) return;
        RequestId id = *state_.transcription;
        if (registry_.retire(id) && collab_.transcriber) {
            collab_.transcriber->cancel(id);
        }
        LOG_DEBUG("Utterance dropped: " + reason);
        state_.transcription.reset();
        state_.transcript = Utterance{};
        state_.utterance_ms = 0;
        state_.finalizing = false;
    }

    void on_final_transcript(const std::string& text, TimePoint now) {
        LOG_ENGINE("User said: \"" + text + "\"");

        if (assistant_paused()) {
            if (InterruptionClassifier::detect_resume_intent(text)) {
                Result<void> result = state_.session->resume();
                if (!result) {
                    Logger::warn("[Barge] " + result.error().to_string());
                } else {
                    LOG_BARGE("Resuming playback");
                }
                return;
            }
            LOG_BARGE("New request while paused, dropping the held reply");
            state_.session->abort("superseded while paused");
            observe_session();
        }

        if (text.empty()) {
            LOG_DEBUG("Empty transcript, nothing to answer");
            return;
        }
        take_turn(text, now);
    }

    void take_turn(const std::string& text, TimePoint now) {
        if (state_.session && !state_.session->is_finished()) {
            state_.session->abort("superseded by a new turn");
        }
        observe_session();

        SessionId id = state_.pending_session++;
        SessionCollaborators session_collab;
        session_collab.synthesizer = collab_.synthesizer;
        session_collab.device = collab_.device;
        session_collab.reply_generator = collab_.reply_generator;
        session_collab.transcriber = collab_.transcriber;

        ducking_.reset();
        state_.session = std::make_unique<PlaybackSession>(id, config_.playback, config_.chunker,
                                                           registry_, session_collab, now);
        last_state_ = state_.session->state();
        classifier_.reset_burst();
        state_.turn_number++;

        ReplyHints hints;
        hints.prefer_concise = state_.impatient;
        state_.impatient = false;

        RequestTicket ticket = registry_.issue(id, RequestKind::Reply, std::nullopt, now);
        if (!state_.session->verify_owned(ticket)) {
            return;
        }
        if (recorder_) {
            recorder_->record_event(id, "turn", text);
        }
        LOG_ENGINE("Turn " + std::to_string(state_.turn_number) + ": requesting reply" +
                   (hints.prefer_concise ? " (concise)" : ""));
        if (collab_.reply_generator) {
            collab_.reply_generator->generate(ticket, text, hints);
        }
    }

    void check_timeouts(TimePoint now) {
        for (const auto& ticket : registry_.expired(now, config_.playback.collaborator_timeout_ms)) {
            if (!registry_.is_live(ticket.id)) continue;   // retired by an earlier abort this loop

            if (ticket.kind == RequestKind::Transcription) {
                if (state_.transcription && *state_.transcription == ticket.id) {
                    Logger::warn("[Engine] " + make_timeout_error("transcription").to_string());
                    drop_utterance("transcription timed out");
                } else {
                    registry_.retire(ticket.id);
                }
                continue;
            }

            CollaboratorFailure failure;
            failure.request = ticket.id;
            failure.session = ticket.session;
            failure.kind = ticket.kind;
            failure.error = make_timeout_error(std::string(request_kind_to_string(ticket.kind)) +
                                               " request timed out");
            if (state_.session && state_.session->id() == ticket.session) {
                if (state_.session->on_failure(failure)) {
                    classifier_.reset_burst();
                    LOG_ENGINE("Reply abandoned, back to listening");
                }
            } else {
                registry_.retire(ticket.id);
                LOG_DEBUG("Retired orphan request " + std::to_string(ticket.id));
            }
        }
    }

    /**
     * @brief Log and record state changes; release a finished session
     */
    void observe_session() {
        if (!state_.session) return;

        PlaybackState current = state_.session->state();
        if (current != last_state_) {
            LOG_TRACE(state_.session->id(), "transition",
                      std::string(playback_state_to_string(last_state_)) + "->" +
                      playback_state_to_string(current));
            if (recorder_) {
                recorder_->record_transition(state_.session->id(), last_state_, current);
            }
            last_state_ = current;
        }

        if (!state_.session->is_finished()) return;

        if (current == PlaybackState::Completed) {
            classifier_.on_playback_completed(state_.context);
            LOG_ENGINE("Reply complete, listening");
        }
        classifier_.reset_burst();
        ducking_.reset();
        state_.session.reset();
        last_state_ = PlaybackState::Idle;
    }

    EngineConfig config_;
    EngineCollaborators collab_;
    EventInbox inbox_;
    TicketRegistry registry_;
    ConversationState state_;

    vad::FeatureExtractor extractor_;
    InterruptionClassifier classifier_;
    std::unique_ptr<FusionEngine> fusion_;
    ContextAwareThreshold threshold_;
    DuckingController ducking_;
    BackchannelScheduler backchannel_;
    DecisionRecorder* recorder_ = nullptr;

    AudioBuffer tick_audio_;
    std::deque<float> rms_history_;
    PlaybackState last_state_ = PlaybackState::Idle;
    std::atomic<bool> running_;

    struct PredictionState {
        std::optional<RequestId> in_flight;
        RequestId next_id = 1;
        RequestId transcription = 0;         ///< Transcription the request was asked about
        TimePoint launched_at;
        TimePoint retry_at;
        int failures = 0;
        std::optional<TurnDecision> answer;  ///< Unused answer for the open transcription
    };
    PredictionState prediction_;
    // Last member: joins its workers while the inbox is still alive
    std::unique_ptr<IRemotePredictor> remote_;
};

TurnEngine::TurnEngine(const EngineConfig& config, EngineCollaborators collaborators,
                       std::unique_ptr<IRemotePredictor> remote)
    : pimpl_(std::make_unique<Impl>(config, collaborators, std::move(remote))) {}

TurnEngine::~TurnEngine() = default;

IEventSink& TurnEngine::events() {
    return pimpl_->events();
}

void TurnEngine::push_audio(const AudioFrame& frame) {
    pimpl_->push_audio(frame);
}

TickReport TurnEngine::tick(TimePoint now) {
    return pimpl_->tick(now);
}

int TurnEngine::run(ICaptureDevice& capture) {
    return pimpl_->run(capture);
}

void TurnEngine::shutdown() {
    pimpl_->shutdown();
}

void TurnEngine::feedback(bool was_correct) {
    pimpl_->feedback(was_correct);
}

void TurnEngine::set_recorder(DecisionRecorder* recorder) {
    pimpl_->set_recorder(recorder);
}

EngineStatus TurnEngine::status() const {
    return pimpl_->status();
}

const ConversationState& TurnEngine::state() const {
    return pimpl_->state();
}

const TicketRegistry& TurnEngine::tickets() const {
    return pimpl_->tickets();
}

FusionEngine& TurnEngine::fusion() {
    return pimpl_->fusion();
}

} // namespace turnkeeper
