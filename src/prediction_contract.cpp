#include "prediction_contract.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace turnkeeper {
namespace contract {

namespace {

json features_to_json(const AudioFeatures& f) {
    return json{
        {"silenceDurationMs", f.silence_duration_ms},
        {"intensityRms", f.intensity_rms},
        {"pitchTrend", f.pitch_trend},
        {"speakingRateHz", f.speaking_rate_hz},
        {"isSpeaking", f.is_speaking},
        {"speechDurationMs", f.speech_duration_ms},
        {"dominantFrequencyHz", f.dominant_frequency_hz}
    };
}

AudioFeatures features_from_json(const json& j) {
    AudioFeatures f;
    f.silence_duration_ms = j.value("silenceDurationMs", int64_t{0});
    f.intensity_rms = j.value("intensityRms", 0.0f);
    f.pitch_trend = j.value("pitchTrend", 0.0f);
    f.speaking_rate_hz = j.value("speakingRateHz", 3.0f);
    f.is_speaking = j.value("isSpeaking", false);
    f.speech_duration_ms = j.value("speechDurationMs", int64_t{0});
    f.dominant_frequency_hz = j.value("dominantFrequencyHz", 0.0f);
    return f;
}

} // anonymous namespace

std::string encode_request(const DecisionInput& input) {
    json j;
    j["transcript"] = input.transcript ? json(*input.transcript) : json(nullptr);
    j["audioFeatures"] = input.features ? features_to_json(*input.features) : json(nullptr);
    j["silenceDurationMs"] = input.silence_duration_ms;
    j["fallbackThresholdMs"] = input.fallback_threshold_ms;
    return j.dump();
}

Result<DecisionInput> decode_request(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("silenceDurationMs")) {
            return make_parse_error("turn-prediction request requires silenceDurationMs");
        }

        DecisionInput input;
        if (j.contains("transcript") && j["transcript"].is_string()) {
            input.transcript = j["transcript"].get<std::string>();
        }
        if (j.contains("audioFeatures") && j["audioFeatures"].is_object()) {
            input.features = features_from_json(j["audioFeatures"]);
        }
        input.silence_duration_ms = j["silenceDurationMs"].get<int64_t>();
        input.fallback_threshold_ms = j.value("fallbackThresholdMs", input.fallback_threshold_ms);
        return input;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("turn-prediction request: ") + e.what());
    }
}

std::string encode_decision(const TurnDecision& decision) {
    json j;
    j["takeTurn"] = decision.take_turn;
    j["fusedScore"] = decision.fused_score;
    j["confidence"] = decision.confidence;
    j["method"] = decision_method_to_string(decision.method);

    const DecisionBreakdown& b = decision.breakdown;
    if (decision.method == DecisionMethod::Fusion) {
        j["breakdown"] = {
            {"trp", b.trp},
            {"vapShift", b.vap_shift},
            {"vapHold", b.vap_hold},
            {"textWeight", b.text_weight},
            {"audioWeight", b.audio_weight}
        };
    } else {
        j["breakdown"] = {
            {"silenceDurationMs", b.silence_duration_ms},
            {"thresholdMs", b.threshold_ms}
        };
    }
    return j.dump();
}

Result<TurnDecision> decode_decision(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("takeTurn") || !j.contains("fusedScore")) {
            return make_parse_error("turn-prediction response requires takeTurn and fusedScore");
        }

        TurnDecision decision;
        decision.take_turn = j["takeTurn"].get<bool>();
        decision.fused_score = j["fusedScore"].get<float>();
        decision.confidence = j.value("confidence", 0.5f);

        std::string method = j.value("method", std::string("fusion"));
        decision.method = method == "fusion" ? DecisionMethod::Fusion : DecisionMethod::Fallback;

        if (j.contains("breakdown") && j["breakdown"].is_object()) {
            const json& b = j["breakdown"];
            decision.breakdown.trp = b.value("trp", 0.0f);
            decision.breakdown.vap_shift = b.value("vapShift", 0.0f);
            decision.breakdown.vap_hold = b.value("vapHold", 0.0f);
            decision.breakdown.text_weight = b.value("textWeight", 0.0f);
            decision.breakdown.audio_weight = b.value("audioWeight", 0.0f);
            decision.breakdown.silence_duration_ms = b.value("silenceDurationMs", int64_t{0});
            decision.breakdown.threshold_ms = b.value("thresholdMs", int64_t{0});
        }
        decision.text_score = decision.breakdown.trp;
        decision.audio_score = decision.breakdown.vap_shift;
        return decision;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("turn-prediction response: ") + e.what());
    }
}

} // namespace contract
} // namespace turnkeeper
