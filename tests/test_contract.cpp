/**
 * Tests for the turn-prediction wire format and the remote predictor.
 * Asserts:
 * - Requests and decisions keep every field the endpoint contract names.
 * - Fallback decisions use the "simple_threshold" method and carry the
 *   silence/threshold breakdown instead of scores.
 * - Bodies without the required fields are ParseErrors.
 * - An unreachable endpoint reports its failure as a TurnPrediction event.
 *
 * Run from build dir: ./test_contract
 */

#include "event_inbox.h"
#include "fusion_engine.h"
#include "logger.h"
#include "prediction_contract.h"
#include "remote_turn_predictor.h"
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include <variant>
#include <vector>

using namespace turnkeeper;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)
#define ASSERT_NEAR(a, b, eps) ASSERT(std::fabs((a) - (b)) < (eps))

static AudioFeatures neutral_features(int64_t silence_ms) {
    AudioFeatures f;
    f.silence_duration_ms = silence_ms;
    f.intensity_rms = 0.05f;
    f.speaking_rate_hz = 3.0f;
    f.pitch_trend = 0.0f;
    return f;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Request encoding ---
    {
        DecisionInput input;
        input.transcript = "What time is it?";
        input.features = neutral_features(600);
        input.silence_duration_ms = 600;
        input.fallback_threshold_ms = 900;

        json j = json::parse(contract::encode_request(input));
        ASSERT(j["transcript"] == "What time is it?");
        ASSERT(j["silenceDurationMs"] == 600);
        ASSERT(j["fallbackThresholdMs"] == 900);
        ASSERT(j["audioFeatures"].is_object());
        ASSERT(j["audioFeatures"]["silenceDurationMs"] == 600);
        ASSERT(j["audioFeatures"].contains("intensityRms"));
        ASSERT(j["audioFeatures"].contains("pitchTrend"));
        ASSERT(j["audioFeatures"].contains("speakingRateHz"));

        Result<DecisionInput> decoded = contract::decode_request(j.dump());
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().transcript && *decoded.value().transcript == "What time is it?");
        ASSERT(decoded.value().features.has_value());
        ASSERT_NEAR(decoded.value().features->speaking_rate_hz, 3.0f, 1e-5f);
        ASSERT(decoded.value().fallback_threshold_ms == 900);
    }

    // Missing transcript and features travel as null and decode as absent
    {
        DecisionInput input;
        input.silence_duration_ms = 1200;
        json j = json::parse(contract::encode_request(input));
        ASSERT(j["transcript"].is_null());
        ASSERT(j["audioFeatures"].is_null());

        Result<DecisionInput> decoded = contract::decode_request(j.dump());
        ASSERT(decoded.is_ok());
        ASSERT(!decoded.value().transcript);
        ASSERT(!decoded.value().features);
        ASSERT(decoded.value().fallback_threshold_ms == 800);
    }

    // --- Decision encoding ---
    {
        FusionEngine engine;
        DecisionInput input;
        input.transcript = "Hello how are you?";
        input.features = neutral_features(600);
        input.silence_duration_ms = 600;
        TurnDecision decision = engine.decide(input);
        ASSERT(decision.method == DecisionMethod::Fusion);

        json j = json::parse(contract::encode_decision(decision));
        ASSERT(j["method"] == "fusion");
        ASSERT(j["takeTurn"] == decision.take_turn);
        ASSERT(j["breakdown"].contains("trp"));
        ASSERT(j["breakdown"].contains("vapShift"));
        ASSERT(j["breakdown"].contains("vapHold"));
        ASSERT(j["breakdown"].contains("textWeight"));
        ASSERT(j["breakdown"].contains("audioWeight"));
        ASSERT(!j["breakdown"].contains("thresholdMs"));

        Result<TurnDecision> decoded = contract::decode_decision(j.dump());
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().take_turn == decision.take_turn);
        ASSERT(decoded.value().method == DecisionMethod::Fusion);
        ASSERT_NEAR(decoded.value().fused_score, decision.fused_score, 1e-5f);
        ASSERT_NEAR(decoded.value().text_score, decision.text_score, 1e-5f);
        ASSERT_NEAR(decoded.value().breakdown.text_weight, 0.6f, 1e-5f);
    }
    {
        TurnDecision fallback = FusionEngine::decide_fallback(900, 800);
        json j = json::parse(contract::encode_decision(fallback));
        ASSERT(j["method"] == "simple_threshold");
        ASSERT(j["takeTurn"] == true);
        ASSERT(j["breakdown"]["silenceDurationMs"] == 900);
        ASSERT(j["breakdown"]["thresholdMs"] == 800);
        ASSERT(!j["breakdown"].contains("trp"));

        Result<TurnDecision> decoded = contract::decode_decision(j.dump());
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().method == DecisionMethod::Fallback);
        ASSERT(decoded.value().breakdown.threshold_ms == 800);
    }

    // Minimal response from a third-party predictor
    {
        Result<TurnDecision> decoded = contract::decode_decision(R"({"takeTurn": false, "fusedScore": 0.4})");
        ASSERT(decoded.is_ok());
        ASSERT(!decoded.value().take_turn);
        ASSERT(decoded.value().method == DecisionMethod::Fusion);
        ASSERT_NEAR(decoded.value().confidence, 0.5f, 1e-6f);
    }

    // --- Malformed bodies ---
    {
        Result<TurnDecision> garbage = contract::decode_decision("<html>502 Bad Gateway</html>");
        ASSERT(!garbage && garbage.error().type == ErrorType::ParseError);
        Result<TurnDecision> missing = contract::decode_decision(R"({"fusedScore": 0.9})");
        ASSERT(!missing && missing.error().type == ErrorType::ParseError);
        Result<TurnDecision> wrong_type = contract::decode_decision(R"({"takeTurn": "yes", "fusedScore": 0.9})");
        ASSERT(!wrong_type && wrong_type.error().type == ErrorType::ParseError);
        Result<DecisionInput> no_silence = contract::decode_request(R"({"transcript": "hi"})");
        ASSERT(!no_silence && no_silence.error().type == ErrorType::ParseError);
        Result<DecisionInput> array = contract::decode_request("[1, 2, 3]");
        ASSERT(!array && array.error().type == ErrorType::ParseError);
    }

    // --- Unreachable endpoint: the failure comes back as an event ---
    {
        config::RemotePredictorConfig remote;
        remote.enabled = true;
        remote.endpoint = "http://127.0.0.1:1/api/turn-prediction";
        remote.timeout_ms = 200;
        remote.connect_timeout_ms = 100;
        RemoteTurnPredictor predictor(remote);

        DecisionInput input;
        input.transcript = "What time is it?";
        input.features = neutral_features(600);
        input.silence_duration_ms = 600;

        Result<TurnDecision> direct = predictor.request(input);
        ASSERT(!direct);
        ASSERT(direct.error().type == ErrorType::NetworkError ||
               direct.error().type == ErrorType::CollaboratorTimeout);

        EventInbox inbox;
        predictor.launch(7, input, inbox);
        std::vector<CollaboratorEvent> events;
        for (int i = 0; i < 300 && events.empty(); ++i) {
            events = inbox.drain();
            if (events.empty()) std::this_thread::sleep_for(Duration(10));
        }
        ASSERT(events.size() == 1);
        ASSERT(!events.empty() && std::holds_alternative<TurnPrediction>(events[0]));
        if (!events.empty() && std::holds_alternative<TurnPrediction>(events[0])) {
            const TurnPrediction& prediction = std::get<TurnPrediction>(events[0]);
            ASSERT(prediction.request == 7);
            ASSERT(!prediction.decision);
            ASSERT(prediction.error.type == ErrorType::NetworkError ||
                   prediction.error.type == ErrorType::CollaboratorTimeout);
        }
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All contract tests passed.\n";
    return 0;
}
