/**
 * End-to-end engine tests with recording collaborators and synthetic audio.
 * Asserts:
 * - Speech, silence and a complete transcript produce exactly one reply request.
 * - Sustained speech over playback aborts the reply and becomes the next turn.
 * - Backchannels keep playback going; "wait" pauses and "go on" resumes.
 * - Late results for an aborted reply never play; stalled requests time out.
 * - A reply waiting on its next chunk still counts as playing.
 * - Remote turn predictions never block a tick; failures back off.
 *
 * Run from build dir: ./test_engine
 */

#include "decision_recorder.h"
#include "fakes.h"
#include "logger.h"
#include "turn_engine.h"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace turnkeeper;
using namespace turnkeeper::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static const double TWO_PI = 6.283185307179586;

/// One 50 ms tick of a 200 Hz tone; 0 amplitude is silence
static AudioFrame tick_audio(float amplitude) {
    AudioFrame frame(800);
    for (size_t i = 0; i < frame.size(); ++i) {
        double t = static_cast<double>(i) / DEFAULT_SAMPLE_RATE;
        frame[i] = static_cast<Sample>(amplitude * std::sin(TWO_PI * 200.0 * t + 0.1));
    }
    return frame;
}

static const float LOUD = 6000.0f;        // rms ~0.13
static const float MURMUR = 1800.0f;      // rms ~0.039: audible over playback, still quiet

struct Harness {
    FakeTranscriber transcriber;
    FakeReplyGenerator generator;
    FakeSynthesizer synth;
    FakePlaybackDevice device;
    EngineConfig config;
    std::unique_ptr<TurnEngine> engine;
    TimePoint now = Clock::now();
    std::vector<TickReport> reports;

    explicit Harness(const EngineConfig& cfg = EngineConfig::defaults(),
                     std::unique_ptr<IRemotePredictor> remote = nullptr)
        : config(cfg) {
        EngineCollaborators c;
        c.transcriber = &transcriber;
        c.reply_generator = &generator;
        c.synthesizer = &synth;
        c.device = &device;
        engine = std::make_unique<TurnEngine>(config, c, std::move(remote));
    }

    TickReport step(float amplitude) {
        engine->push_audio(tick_audio(amplitude));
        TickReport report = engine->tick(now);
        now += Duration(config.features.tick_ms);
        reports.push_back(report);
        return report;
    }

    void speak(int ms, float amplitude = LOUD) {
        for (int t = 0; t < ms; t += config.features.tick_ms) step(amplitude);
    }

    void silence(int ms) {
        for (int t = 0; t < ms; t += config.features.tick_ms) step(0.0f);
    }

    void post(CollaboratorEvent event) {
        engine->events().post(std::move(event));
    }

    RequestTicket transcription() const {
        return transcriber.started.back();
    }

    /// Partial transcript, silence until the engine finalizes, then the final transcript
    bool finish_turn(const std::string& text, int max_silence_ms = 3000) {
        RequestTicket ticket = transcription();
        post(transcript(ticket, text, false));
        size_t finalized = transcriber.finalized.size();
        for (int t = 0; t < max_silence_ms && transcriber.finalized.size() == finalized;
             t += config.features.tick_ms) {
            step(0.0f);
        }
        if (transcriber.finalized.size() == finalized) return false;
        post(transcript(ticket, text, true));
        step(0.0f);
        return true;
    }

    bool user_turn(const std::string& text, int speech_ms = 1000) {
        speak(speech_ms);
        return finish_turn(text);
    }

    /// Stream the reply for the last request and synthesize the first `ready` chunks
    void reply(const std::vector<std::string>& deltas, size_t ready) {
        RequestTicket ticket = generator.calls.back().ticket;
        size_t first_call = synth.calls.size();
        for (size_t i = 0; i < deltas.size(); ++i) {
            post(reply_delta(ticket, deltas[i], i + 1 == deltas.size()));
        }
        step(0.0f);
        for (size_t i = first_call; i < synth.calls.size() && i < first_call + ready; ++i) {
            post(synthesis_ready(synth.calls[i]));
        }
        step(0.0f);
    }

    bool saw(InterruptionType type) const {
        for (const auto& r : reports) {
            for (const auto& e : r.interruptions) {
                if (e.type == type) return true;
            }
        }
        return false;
    }
};

static const std::vector<std::string> TWO_SENTENCES = {
    "It is three o'clock in the afternoon and the sun is still high up. ",
    "Plenty of daylight left."
};

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- A complete turn: one reply request, played through, back to listening ---
    {
        Harness h;
        ASSERT(h.engine->status() == EngineStatus::Listening);

        h.silence(200);
        ASSERT(h.transcriber.started.empty());

        h.speak(1000);
        ASSERT(h.transcriber.started.size() == 1);
        ASSERT(h.transcriber.started[0].kind == RequestKind::Transcription);
        ASSERT(h.transcriber.fed_samples[h.transcription().id] == 20 * 800);
        ASSERT(h.engine->status() == EngineStatus::UserSpeaking);
        ASSERT(h.engine->state().utterance_ms == 1000);

        ASSERT(h.finish_turn("What time is it?"));
        ASSERT(h.engine->state().last_decision.has_value());
        ASSERT(h.engine->state().last_decision->take_turn);
        ASSERT(h.generator.calls.size() == 1);
        ASSERT(h.generator.calls[0].user_text == "What time is it?");
        ASSERT(!h.generator.calls[0].hints.prefer_concise);
        ASSERT(h.generator.calls[0].ticket.kind == RequestKind::Reply);
        ASSERT(h.engine->status() == EngineStatus::Thinking);
        ASSERT(h.engine->state().turn_number == 1);
        ASSERT(!h.engine->state().transcription);

        SessionId session = h.generator.calls[0].ticket.session;
        h.reply(TWO_SENTENCES, 2);
        ASSERT(h.synth.calls.size() == 2);
        ASSERT(h.device.plays.size() == 1);
        ASSERT(h.device.plays[0].session == session);
        ASSERT(h.engine->status() == EngineStatus::Speaking);

        h.post(playback_finished(session, 0));
        h.step(0.0f);
        ASSERT(h.device.plays.size() == 2);
        h.post(playback_finished(session, 1));
        h.step(0.0f);
        ASSERT(h.engine->status() == EngineStatus::Listening);
        ASSERT(!h.engine->state().session);
        ASSERT(h.engine->tickets().live_count() == 0);

        // Silence alone never asks for another reply
        h.silence(2000);
        ASSERT(h.generator.calls.size() == 1);
    }

    // --- Too short to be a turn ---
    {
        Harness h;
        h.speak(300);
        RequestTicket ticket = h.transcription();
        ASSERT(!h.finish_turn("Hi."));
        ASSERT(contains_id(h.transcriber.canceled, ticket.id));
        ASSERT(h.generator.calls.empty());
        ASSERT(h.engine->status() == EngineStatus::Listening);
    }

    // --- Barge-in: abort, cancel outstanding work, the interruption is the next turn ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        SessionId first = h.generator.calls[0].ticket.session;
        h.reply(TWO_SENTENCES, 1);   // chunk 1 still synthesizing
        ASSERT(h.engine->status() == EngineStatus::Speaking);
        RequestId outstanding = h.synth.request_for(1);

        h.speak(200);
        ASSERT(h.device.volume < 1.0f);
        ASSERT(h.engine->status() == EngineStatus::Speaking);
        h.speak(800);
        ASSERT(h.saw(InterruptionType::Interruption));
        ASSERT(h.device.stops == 1);
        ASSERT(contains_id(h.synth.canceled, outstanding));
        ASSERT(!h.engine->state().session);
        ASSERT(h.engine->state().context.total_interruptions == 1);
        ASSERT(h.engine->status() == EngineStatus::UserSpeaking);
        ASSERT(h.transcriber.started.size() == 2);
        ASSERT(h.transcriber.canceled.empty());

        // Late results for the aborted reply are discarded
        h.post(synthesis_ready(h.synth.calls[1]));
        h.post(playback_finished(first, 0));
        h.step(LOUD);
        ASSERT(h.device.plays.size() == 1);

        ASSERT(h.finish_turn("Actually tell me about Paris."));
        ASSERT(h.generator.calls.size() == 2);
        ASSERT(h.generator.calls[1].user_text == "Actually tell me about Paris.");
        ASSERT(h.generator.calls[1].ticket.session != first);
    }

    // --- Backchannel over playback: keep talking ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        h.reply(TWO_SENTENCES, 2);
        ASSERT(h.engine->status() == EngineStatus::Speaking);

        h.speak(300, MURMUR);
        h.silence(50);
        ASSERT(h.saw(InterruptionType::Backchannel));
        ASSERT(!h.saw(InterruptionType::Interruption));
        ASSERT(h.engine->status() == EngineStatus::Speaking);
        ASSERT(h.device.stops == 0);
        ASSERT(!h.engine->state().transcription);
        ASSERT(h.transcriber.canceled.size() == 1);
        ASSERT(h.generator.calls.size() == 1);
    }

    // --- Pause on "wait", resume on "go on" ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        h.reply(TWO_SENTENCES, 2);

        h.speak(50);
        h.post(transcript(h.transcription(), "wait a moment", false));
        h.speak(400);
        ASSERT(h.saw(InterruptionType::Pause));
        ASSERT(h.engine->status() == EngineStatus::Paused);
        ASSERT(h.device.pauses == 1);
        ASSERT(h.device.stops == 0);
        ASSERT(h.engine->state().session->paused_at().has_value());
        ASSERT(!h.engine->state().transcription);

        // Still speaking after the command: not a new request
        size_t started = h.transcriber.started.size();
        h.speak(200);
        ASSERT(h.transcriber.started.size() == started);
        h.silence(1000);
        ASSERT(h.engine->status() == EngineStatus::Paused);

        ASSERT(h.user_turn("Okay, go on.", 400));
        ASSERT(h.device.resumes == 1);
        ASSERT(h.engine->status() == EngineStatus::Speaking);
        ASSERT(h.generator.calls.size() == 1);
    }

    // --- A new question while paused replaces the held reply ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        h.reply(TWO_SENTENCES, 2);
        h.speak(50);
        h.post(transcript(h.transcription(), "hold on", false));
        h.speak(400);
        h.silence(500);
        ASSERT(h.engine->status() == EngineStatus::Paused);

        ASSERT(h.user_turn("What is the weather like?"));
        ASSERT(h.device.stops == 1);
        ASSERT(h.generator.calls.size() == 2);
        ASSERT(h.engine->status() == EngineStatus::Thinking);
    }

    // --- Waiting on the next chunk still counts as playing ---
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.backchannel.enabled = true;
        Harness h(cfg);
        ASSERT(h.user_turn("What time is it?"));
        SessionId session = h.generator.calls[0].ticket.session;
        h.reply(TWO_SENTENCES, 1);
        h.post(playback_finished(session, 0));
        h.step(0.0f);
        ASSERT(h.engine->status() == EngineStatus::Speaking);
        ASSERT(h.engine->state().session && !h.engine->state().session->is_audible());

        size_t first = h.reports.size();
        h.speak(2200);
        for (size_t i = first; i < h.reports.size(); ++i) {
            if (h.reports[i].status == EngineStatus::Speaking) {
                ASSERT(!h.reports[i].backchannel);
            }
        }
        // The overlap went through the classifier, not straight to end of turn
        ASSERT(h.saw(InterruptionType::Interruption));
        ASSERT(!h.engine->state().session);
        ASSERT(h.engine->status() == EngineStatus::UserSpeaking);
    }

    // --- Interruption handling off: half-duplex ---
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.interruption.enabled = false;
        cfg.interruption.enable_pause_resume = false;
        ASSERT(cfg.validate().empty());
        Harness h(cfg);
        ASSERT(h.user_turn("What time is it?"));
        h.reply(TWO_SENTENCES, 2);
        size_t started = h.transcriber.started.size();
        h.speak(1500);
        ASSERT(h.device.stops == 0);
        ASSERT(h.transcriber.started.size() == started);
        ASSERT(h.engine->status() == EngineStatus::Speaking);
    }

    // --- Repeated barge-ins make the next reply concise ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        for (int i = 0; i < 3; ++i) {
            h.reply(TWO_SENTENCES, 1);
            h.speak(1000);
            ASSERT(h.finish_turn("No, tell me something else."));
        }
        ASSERT(h.saw(InterruptionType::Impatience));
        ASSERT(h.generator.calls.size() == 4);
        ASSERT(!h.generator.calls[2].hints.prefer_concise);
        ASSERT(h.generator.calls[3].hints.prefer_concise);
    }

    // --- Stalled reply times out; a failed transcription drops the turn ---
    {
        Harness h;
        ASSERT(h.user_turn("What time is it?"));
        ASSERT(h.engine->status() == EngineStatus::Thinking);
        RequestId reply = h.generator.calls[0].ticket.id;
        h.now += Duration(h.config.playback.collaborator_timeout_ms + 100);
        h.step(0.0f);
        ASSERT(h.engine->status() == EngineStatus::Listening);
        ASSERT(contains_id(h.generator.canceled, reply));
        ASSERT(h.engine->tickets().live_count() == 0);

        // A reply after the timeout is ignored
        h.post(reply_delta(h.generator.calls[0].ticket, "Too late. Nobody is listening any more now.", true));
        h.step(0.0f);
        ASSERT(h.synth.calls.empty());

        h.speak(500);
        RequestTicket ticket = h.transcription();
        h.post(failure(ticket));
        h.step(LOUD);
        ASSERT(contains_id(h.transcriber.canceled, ticket.id));
        // Still speaking, so a fresh transcription picks the speech up
        ASSERT(h.transcriber.started.size() == 3);
        ASSERT(h.engine->state().transcription && *h.engine->state().transcription != ticket.id);
    }

    // --- Decisions are recorded ---
    {
        std::string dir = (std::filesystem::temp_directory_path() / "turnkeeper_test_records").string();
        DecisionRecorder recorder(dir);
        ASSERT(recorder.start().is_ok());
        Harness h;
        h.engine->set_recorder(&recorder);
        ASSERT(h.user_turn("What time is it?"));
        h.reply(TWO_SENTENCES, 1);
        ASSERT(recorder.records_written() >= 3);
        recorder.finish();

        std::ifstream in(recorder.get_path());
        ASSERT(in.good());
        std::string line;
        bool has_decision = false;
        while (std::getline(in, line)) {
            if (line.find("\"decision\"") != std::string::npos) has_decision = true;
        }
        ASSERT(has_decision);
        std::filesystem::remove_all(dir);
    }

    // --- Weight feedback only when adaptation is on ---
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.fusion.enable_adaptation = true;
        Harness h(cfg);
        ASSERT(h.user_turn("What time is it?"));
        float before = h.engine->fusion().text_weight();
        h.engine->feedback(false);
        ASSERT(h.engine->fusion().text_weight() != before);

        Harness fixed;
        ASSERT(fixed.user_turn("What time is it?"));
        fixed.engine->feedback(false);
        ASSERT(fixed.engine->fusion().text_weight() == fixed.config.fusion.text_weight);
    }

    // --- Remote predictor: one request in flight, local decisions meanwhile ---
    {
        auto remote = std::make_unique<FakeRemotePredictor>();
        FakeRemotePredictor* fake = remote.get();
        Harness h(EngineConfig::defaults(), std::move(remote));
        ASSERT(h.user_turn("What time is it?"));
        ASSERT(fake->launches.size() == 1);
        ASSERT(fake->launches[0].input.transcript.has_value());
        ASSERT(*fake->launches[0].input.transcript == "What time is it?");
        ASSERT(h.generator.calls.size() == 1);
        ASSERT(h.engine->state().last_decision->method == DecisionMethod::Fusion);

        // Unanswered request from the finished turn is dropped when it finally arrives
        h.post(prediction(fake->launches[0].id, true));
        h.step(0.0f);
        ASSERT(h.transcriber.finalized.size() == 1);
    }

    // --- Remote answers end the turn; answers about earlier silence do not ---
    {
        auto remote = std::make_unique<FakeRemotePredictor>();
        FakeRemotePredictor* fake = remote.get();
        Harness h(EngineConfig::defaults(), std::move(remote));
        h.speak(1000);
        for (int i = 0; i < 10 && fake->launches.empty(); ++i) h.step(0.0f);
        ASSERT(fake->launches.size() == 1);
        ASSERT(!fake->launches[0].input.transcript);

        // User spoke again before the answer came back
        h.speak(200);
        h.post(prediction(fake->launches[0].id, true));
        h.step(0.0f);
        ASSERT(h.transcriber.finalized.empty());

        for (int i = 0; i < 10 && fake->launches.size() < 2; ++i) h.step(0.0f);
        ASSERT(fake->launches.size() == 2);
        ASSERT(h.transcriber.finalized.empty());
        h.post(prediction(fake->launches[1].id, true));
        h.step(0.0f);
        ASSERT(h.transcriber.finalized.size() == 1);
        ASSERT(h.engine->state().last_decision && h.engine->state().last_decision->take_turn);
        ASSERT(fake->launches.size() == 2);
    }

    // --- A failed remote request backs off before the next one ---
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.remote.retry_backoff_ms = 300;
        auto remote = std::make_unique<FakeRemotePredictor>();
        FakeRemotePredictor* fake = remote.get();
        Harness h(cfg, std::move(remote));
        h.speak(1000);
        for (int i = 0; i < 10 && fake->launches.empty(); ++i) h.step(0.0f);
        ASSERT(fake->launches.size() == 1);

        h.post(prediction_failure(fake->launches[0].id));
        h.step(0.0f);
        h.silence(200);
        ASSERT(fake->launches.size() == 1);
        h.silence(150);
        ASSERT(fake->launches.size() == 2);
        ASSERT(fake->launches[1].id != fake->launches[0].id);
        ASSERT(h.transcriber.finalized.empty());
    }

    // --- A real endpoint that never answers does not slow the ticks ---
    {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.remote.enabled = true;
        cfg.remote.endpoint = "http://10.255.255.1:9/api/turn-prediction";
        cfg.remote.timeout_ms = 500;
        cfg.remote.connect_timeout_ms = 500;
        Harness h(cfg);
        h.speak(1000);
        auto start = std::chrono::steady_clock::now();
        h.silence(250);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ASSERT(elapsed < 200);
        ASSERT(h.engine->status() == EngineStatus::UserSpeaking);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All engine tests passed.\n";
    return 0;
}
