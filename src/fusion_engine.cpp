#include "fusion_engine.h"
#include "scoring/prosody_scorer.h"
#include "scoring/text_completion_scorer.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace turnkeeper {

namespace {

float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

} // anonymous namespace

FusionEngine::FusionEngine(const config::FusionConfig& config,
                           std::unique_ptr<scoring::ITextScorer> text_scorer,
                           std::unique_ptr<scoring::IProsodyScorer> prosody_scorer)
    : config_(config)
    , text_weight_(config.text_weight)
    , text_scorer_(std::move(text_scorer))
    , prosody_scorer_(std::move(prosody_scorer)) {
    if (!text_scorer_) {
        text_scorer_ = std::make_unique<scoring::TextCompletionScorer>();
    }
    if (!prosody_scorer_) {
        prosody_scorer_ = std::make_unique<scoring::ProsodyScorer>();
    }

    std::ostringstream oss;
    oss << "Fusion engine: text=" << text_scorer_->name()
        << " audio=" << prosody_scorer_->name()
        << " text_weight=" << text_weight_
        << " threshold=" << config_.threshold;
    LOG_FUSION(oss.str());
}

FusionEngine::~FusionEngine() = default;

TurnDecision FusionEngine::decide(const DecisionInput& input) {
    bool has_transcript = input.transcript.has_value() &&
                          !utils::is_empty_or_whitespace(*input.transcript);

    if (has_transcript && input.features.has_value()) {
        if (text_scorer_->is_available() && prosody_scorer_->is_available()) {
            return decide_fusion(*input.transcript, *input.features, input.silence_duration_ms);
        }
        LOG_FUSION("Scorer unavailable, using silence threshold");
    }

    return decide_fallback(input.silence_duration_ms, input.fallback_threshold_ms);
}

TurnDecision FusionEngine::decide_fusion(const std::string& transcript,
                                         const AudioFeatures& features,
                                         int64_t silence_duration_ms) {
    AudioFeatures at_silence = features;
    at_silence.silence_duration_ms = silence_duration_ms;

    float trp = clamp01(text_scorer_->score(transcript));
    ProsodyPrediction vap = prosody_scorer_->score(at_silence);
    float shift = clamp01(vap.shift);

    TurnDecision decision;
    decision.method = DecisionMethod::Fusion;
    decision.text_score = trp;
    decision.audio_score = shift;
    decision.fused_score = clamp01(trp * text_weight_ + shift * audio_weight());
    decision.take_turn = decision.fused_score >= config_.threshold;
    decision.confidence = clamp01(1.0f - 0.5f * std::fabs(trp - shift));
    decision.breakdown.trp = trp;
    decision.breakdown.vap_shift = shift;
    decision.breakdown.vap_hold = clamp01(vap.hold);
    decision.breakdown.text_weight = text_weight_;
    decision.breakdown.audio_weight = audio_weight();
    decision.breakdown.silence_duration_ms = silence_duration_ms;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << (decision.take_turn ? "TAKE_TURN" : "WAIT")
        << " fused=" << decision.fused_score
        << " trp=" << trp << " shift=" << shift
        << " confidence=" << decision.confidence
        << " silence=" << silence_duration_ms << "ms";
    LOG_FUSION(oss.str());

    return decision;
}

TurnDecision FusionEngine::decide_fallback(int64_t silence_duration_ms, int threshold_ms) {
    int threshold = std::max(threshold_ms, 1);

    TurnDecision decision;
    decision.method = DecisionMethod::Fallback;
    decision.take_turn = silence_duration_ms >= threshold;
    decision.fused_score = static_cast<float>(silence_duration_ms) / static_cast<float>(threshold);
    decision.confidence = 0.5f;
    decision.breakdown.silence_duration_ms = silence_duration_ms;
    decision.breakdown.threshold_ms = threshold;
    return decision;
}

void FusionEngine::update_weights(bool was_correct, const TurnDecision& decision) {
    if (was_correct || decision.method != DecisionMethod::Fusion) {
        return;
    }

    float text_distance = std::fabs(decision.breakdown.trp - 0.5f);
    float audio_distance = std::fabs(decision.breakdown.vap_shift - 0.5f);

    if (text_distance > audio_distance) {
        text_weight_ = std::max(config_.min_text_weight, text_weight_ - config_.adapt_step);
    } else {
        text_weight_ = std::min(config_.max_text_weight, text_weight_ + config_.adapt_step);
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Updated weights: text=" << text_weight_ << " audio=" << audio_weight();
    Logger::info("[Fusion] " + oss.str());
}

} // namespace turnkeeper
