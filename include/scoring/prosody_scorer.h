#pragma once

/**
 * @file prosody_scorer.h
 * @brief Heuristic hold/shift projection from prosody
 *
 * Starts from hold = shift = 0.5 and applies symmetric adjustments:
 * - silence: >2000ms 0.3, >1000ms 0.2, >500ms 0.1 toward shift
 * - pitch:   falling (< -0.2) 0.15 toward shift, rising (> 0.2) toward hold
 * - energy:  < 0.02 0.1 toward shift, > 0.08 toward hold
 * - rate:    < 2.5 Hz 0.1 toward shift, > 4.0 Hz toward hold
 * Each probability is clamped to [0,1] and the pair renormalized.
 */

#include "scoring/scorer_interface.h"

namespace turnkeeper {
namespace scoring {

class ProsodyScorer : public IProsodyScorer {
public:
    ProsodyPrediction score(const AudioFeatures& features) override;
    const char* name() const override { return "heuristic-vap"; }
};

} // namespace scoring
} // namespace turnkeeper
