#pragma once

/**
 * @file fusion_engine.h
 * @brief End-of-turn decision from text and prosody scores
 *
 * With both a transcript and prosodic features:
 *   fused = trp * w_t + shift * (1 - w_t), take turn when fused >= threshold.
 * Otherwise the silence duration alone is compared with a fallback threshold.
 */

#include "core/config.h"
#include "core/types.h"
#include "scoring/scorer_interface.h"
#include <memory>
#include <optional>
#include <string>

namespace turnkeeper {

/**
 * @brief Everything one decision tick knows
 */
struct DecisionInput {
    std::optional<std::string> transcript;     ///< Missing or blank => fallback
    std::optional<AudioFeatures> features;     ///< Missing => fallback
    int64_t silence_duration_ms = 0;
    int fallback_threshold_ms = constants::fusion::FALLBACK_THRESHOLD_MS;
};

class FusionEngine {
public:
    /**
     * @param text_scorer Null selects the heuristic TRP scorer
     * @param prosody_scorer Null selects the heuristic VAP scorer
     */
    explicit FusionEngine(const config::FusionConfig& config = {},
                          std::unique_ptr<scoring::ITextScorer> text_scorer = nullptr,
                          std::unique_ptr<scoring::IProsodyScorer> prosody_scorer = nullptr);
    ~FusionEngine();

    /**
     * @brief Fusion when transcript, features and both scorers are available,
     *        silence-threshold fallback otherwise
     */
    TurnDecision decide(const DecisionInput& input);

    /**
     * @brief Fused decision; features' silence is replaced by silence_duration_ms
     */
    TurnDecision decide_fusion(const std::string& transcript,
                               const AudioFeatures& features,
                               int64_t silence_duration_ms);

    /**
     * @brief Silence-only decision; fused_score may exceed 1
     */
    static TurnDecision decide_fallback(int64_t silence_duration_ms, int threshold_ms);

    /**
     * @brief Online adaptation from feedback on an earlier decision
     *
     * Only wrong fusion decisions move the weight: by the configured step,
     * away from whichever scorer strayed further from 0.5, within
     * [min_text_weight, max_text_weight].
     */
    void update_weights(bool was_correct, const TurnDecision& decision);

    float text_weight() const { return text_weight_; }
    float audio_weight() const { return 1.0f - text_weight_; }
    float threshold() const { return config_.threshold; }

private:
    config::FusionConfig config_;
    float text_weight_;
    std::unique_ptr<scoring::ITextScorer> text_scorer_;
    std::unique_ptr<scoring::IProsodyScorer> prosody_scorer_;
};

} // namespace turnkeeper
