/**
 * Deterministic tests for text/prosody scoring, fusion and the adaptive threshold.
 * Asserts:
 * - Reference utterances land on the expected side of the 0.7 threshold.
 * - Scores stay in [0,1]; longer silence never lowers the shift score.
 * - Missing transcript or features falls back to the silence threshold.
 *
 * Run from build dir: ./test_scoring
 */

#include "context_threshold.h"
#include "fusion_engine.h"
#include "logger.h"
#include "scoring/prosody_scorer.h"
#include "scoring/text_completion_scorer.h"
#include <cmath>
#include <iostream>
#include <string>

using namespace turnkeeper;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)
#define ASSERT_NEAR(a, b, eps) ASSERT(std::fabs((a) - (b)) < (eps))

static AudioFeatures neutral(int64_t silence_ms) {
    AudioFeatures f;
    f.silence_duration_ms = silence_ms;
    f.intensity_rms = 0.05f;
    f.pitch_trend = 0.0f;
    f.speaking_rate_hz = 3.0f;
    return f;
}

static DecisionInput input_for(const std::string& transcript, int64_t silence_ms) {
    DecisionInput input;
    input.transcript = transcript;
    input.features = neutral(silence_ms);
    input.silence_duration_ms = silence_ms;
    return input;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- Text completion (TRP) ---
    scoring::TextCompletionScorer text;
    ASSERT_NEAR(text.score("Hello how are you?"), 0.79f, 0.001f);
    ASSERT_NEAR(text.score("What time is it?"), 0.895f, 0.001f);
    ASSERT_NEAR(text.score("um..."), 0.39f, 0.001f);
    ASSERT_NEAR(text.score("Yes."), 0.67f, 0.001f);

    scoring::TextScoreBreakdown trailing = text.analyze("I was going to the store and");
    ASSERT_NEAR(trailing.syntactic, 0.2f, 0.001f);
    scoring::TextScoreBreakdown comma = text.analyze("well, you know,");
    ASSERT_NEAR(comma.syntactic, 0.2f, 0.001f);
    scoring::TextScoreBreakdown wh = text.analyze("where is it?");
    ASSERT_NEAR(wh.pragmatic, 0.95f, 0.001f);
    scoring::TextScoreBreakdown directive = text.analyze("please send the report");
    ASSERT_NEAR(directive.pragmatic, 0.85f, 0.001f);
    scoring::TextScoreBreakdown ack = text.analyze("  Sure ");
    ASSERT_NEAR(ack.pragmatic, 0.95f, 0.001f);
    scoring::TextScoreBreakdown yes_no = text.analyze("is it raining?");
    ASSERT_NEAR(yes_no.question, 0.9f, 0.001f);
    scoring::TextScoreBreakdown tag = text.analyze("that was fun, right?");
    ASSERT_NEAR(tag.question, 0.95f, 0.001f);

    // Empty text is neutral, never an error
    ASSERT_NEAR(text.score(""), 0.5f, 0.001f);
    ASSERT_NEAR(text.score("   "), 0.5f, 0.001f);

    const char* samples[] = {"", "and", "ok", "so what", "because of the,", "...",
                             "I think we should go to the park and then maybe grab some food after"};
    for (const char* s : samples) {
        float trp = text.score(s);
        ASSERT(trp >= 0.0f && trp <= 1.0f);
    }

    // --- Prosody (VAP proxy) ---
    scoring::ProsodyScorer prosody;
    ProsodyPrediction base = prosody.score(neutral(0));
    ASSERT_NEAR(base.shift, 0.5f, 0.001f);
    ASSERT_NEAR(base.hold + base.shift, 1.0f, 0.001f);
    ASSERT_NEAR(prosody.score(neutral(600)).shift, 0.6f, 0.001f);
    ASSERT_NEAR(prosody.score(neutral(1500)).shift, 0.7f, 0.001f);
    ASSERT_NEAR(prosody.score(neutral(2500)).shift, 0.8f, 0.001f);

    float previous = 0.0f;
    for (int64_t silence = 0; silence <= 3000; silence += 100) {
        float shift = prosody.score(neutral(silence)).shift;
        ASSERT(shift >= previous);
        previous = shift;
    }

    AudioFeatures falling = neutral(0);
    falling.pitch_trend = -0.5f;
    falling.intensity_rms = 0.01f;
    falling.speaking_rate_hz = 2.0f;
    ProsodyPrediction ending = prosody.score(falling);
    ASSERT_NEAR(ending.shift, 0.85f, 0.001f);

    AudioFeatures rising = neutral(0);
    rising.pitch_trend = 0.5f;
    rising.intensity_rms = 0.2f;
    rising.speaking_rate_hz = 5.0f;
    ProsodyPrediction continuing = prosody.score(rising);
    ASSERT_NEAR(continuing.hold, 0.85f, 0.001f);

    AudioFeatures extreme = neutral(5000);
    extreme.pitch_trend = -1.0f;
    extreme.intensity_rms = 0.0f;
    extreme.speaking_rate_hz = 0.5f;
    ProsodyPrediction saturated = prosody.score(extreme);
    ASSERT(saturated.shift <= 1.0f && saturated.hold >= 0.0f);
    ASSERT_NEAR(saturated.hold + saturated.shift, 1.0f, 0.001f);

    // --- Fusion: reference utterances ---
    FusionEngine fusion;
    TurnDecision hello = fusion.decide(input_for("Hello how are you?", 600));
    ASSERT(hello.method == DecisionMethod::Fusion);
    ASSERT_NEAR(hello.fused_score, 0.714f, 0.001f);
    ASSERT(hello.take_turn);

    TurnDecision wondering = fusion.decide(
        input_for("I was wondering if you could help me with something?", 700));
    ASSERT(wondering.fused_score < 0.7f);
    ASSERT(!wondering.take_turn);

    TurnDecision yes = fusion.decide(input_for("Yes.", 600));
    ASSERT_NEAR(yes.fused_score, 0.642f, 0.001f);
    ASSERT(!yes.take_turn);

    TurnDecision time = fusion.decide(input_for("What time is it?", 1000));
    ASSERT_NEAR(time.fused_score, 0.777f, 0.001f);
    ASSERT(time.take_turn);

    TurnDecision um = fusion.decide(input_for("um...", 1500));
    ASSERT_NEAR(um.fused_score, 0.514f, 0.001f);
    ASSERT(!um.take_turn);

    // Breakdown and confidence
    ASSERT_NEAR(hello.breakdown.trp, 0.79f, 0.001f);
    ASSERT_NEAR(hello.breakdown.vap_shift, 0.6f, 0.001f);
    ASSERT_NEAR(hello.breakdown.text_weight + hello.breakdown.audio_weight, 1.0f, 0.001f);
    ASSERT_NEAR(hello.confidence, 1.0f - 0.5f * std::fabs(0.79f - 0.6f), 0.001f);

    // --- Fusion: fallback paths ---
    DecisionInput no_text;
    no_text.features = neutral(900);
    no_text.silence_duration_ms = 900;
    TurnDecision silent = fusion.decide(no_text);
    ASSERT(silent.method == DecisionMethod::Fallback);
    ASSERT(silent.take_turn);
    ASSERT_NEAR(silent.confidence, 0.5f, 0.001f);
    ASSERT(silent.breakdown.threshold_ms == 800);

    DecisionInput blank = input_for("   ", 400);
    TurnDecision short_silence = fusion.decide(blank);
    ASSERT(short_silence.method == DecisionMethod::Fallback);
    ASSERT(!short_silence.take_turn);
    ASSERT_NEAR(short_silence.fused_score, 0.5f, 0.001f);

    DecisionInput no_features;
    no_features.transcript = "What time is it?";
    no_features.silence_duration_ms = 800;
    ASSERT(fusion.decide(no_features).method == DecisionMethod::Fallback);
    ASSERT(fusion.decide(no_features).take_turn);

    ASSERT(FusionEngine::decide_fallback(799, 800).take_turn == false);
    ASSERT(FusionEngine::decide_fallback(800, 800).take_turn == true);
    ASSERT(FusionEngine::decide_fallback(5, 0).take_turn == true);

    // Monotonic in silence for a fixed transcript
    float last_fused = 0.0f;
    for (int64_t silence = 0; silence <= 3000; silence += 250) {
        float fused = fusion.decide(input_for("I need to think", silence)).fused_score;
        ASSERT(fused >= last_fused - 1e-6f);
        ASSERT(fused >= 0.0f && fused <= 1.0f);
        last_fused = fused;
    }

    // --- Weight adaptation ---
    config::FusionConfig adaptive;
    adaptive.enable_adaptation = true;
    FusionEngine learner(adaptive);
    ASSERT_NEAR(learner.text_weight(), 0.6f, 0.001f);
    learner.update_weights(true, hello);
    ASSERT_NEAR(learner.text_weight(), 0.6f, 0.001f);
    learner.update_weights(false, hello);   // text further from 0.5 than audio
    ASSERT_NEAR(learner.text_weight(), 0.55f, 0.001f);
    for (int i = 0; i < 20; ++i) learner.update_weights(false, hello);
    ASSERT_NEAR(learner.text_weight(), 0.3f, 0.001f);
    learner.update_weights(false, silent);  // fallback decisions never adapt
    ASSERT_NEAR(learner.text_weight(), 0.3f, 0.001f);
    ASSERT_NEAR(learner.text_weight() + learner.audio_weight(), 1.0f, 0.001f);

    // --- Context-aware threshold ---
    config::ContextThresholdConfig clamp;
    ContextAwareThreshold threshold(800, clamp);
    ThresholdContext empty;
    ASSERT(threshold.calculate(empty) == 800);

    ThresholdContext question;
    question.is_question = true;
    ASSERT(threshold.calculate(question) == 640);
    ASSERT(threshold.current() == 640);

    ThresholdContext early_noisy;
    early_noisy.turn_number = 1;
    early_noisy.noise_level = 0.6f;
    ASSERT(threshold.calculate(early_noisy) == 1568);

    ThresholdContext everything;
    everything.transcript_length = 150;
    everything.words_per_second = 1.0f;
    everything.turn_number = 0;
    everything.noise_level = 0.9f;
    everything.interruption_rate = 1.0f;
    everything.average_turn_words = 30.0f;
    ASSERT(threshold.calculate(everything) == 5000);

    ContextAwareThreshold low(300, clamp);
    ThresholdContext fast;
    fast.words_per_second = 6.0f;
    fast.is_question = true;
    ASSERT(low.calculate(fast) == 500);

    ASSERT(ContextAwareThreshold::is_question("are we there yet"));
    ASSERT(ContextAwareThreshold::is_question("it's late?"));
    ASSERT(!ContextAwareThreshold::is_question("Thanks for that"));
    ASSERT_NEAR(ContextAwareThreshold::estimate_speaking_rate("one two three four", 2000), 2.0f, 0.001f);
    ASSERT_NEAR(ContextAwareThreshold::estimate_speaking_rate("one two", 0), 0.0f, 0.001f);
    ASSERT_NEAR(ContextAwareThreshold::estimate_noise_level({}), 0.0f, 0.001f);
    ASSERT_NEAR(ContextAwareThreshold::estimate_noise_level({0.1f, 0.1f, 0.1f}), 0.0f, 0.001f);
    ASSERT_NEAR(ContextAwareThreshold::estimate_noise_level({0.0f, 0.2f}), 1.0f, 0.001f);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All scoring tests passed.\n";
    return 0;
}
