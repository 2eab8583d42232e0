#pragma once

/**
 * @file vad_interface.h
 * @brief Audio feature extraction interface
 *
 * The engine consumes one AudioFeatures snapshot per analysis tick. Keeping
 * the extractor behind an interface lets a model-based VAD replace the
 * energy heuristics without touching the scorers.
 */

#include "core/types.h"
#include <memory>

namespace turnkeeper {
namespace vad {

/**
 * @brief Extractor statistics for debugging
 */
struct Stats {
    float current_rms = 0.0f;
    float threshold = 0.0f;            ///< Effective threshold on the last tick
    int64_t speech_duration_ms = 0;
    int64_t silence_duration_ms = 0;
    size_t pending_samples = 0;        ///< Pushed but not yet analyzed
    uint64_t ticks = 0;
    uint64_t empty_ticks = 0;          ///< Ticks that degraded to silence
};

/**
 * @brief Abstract feature extractor
 */
class IFeatureExtractor {
public:
    virtual ~IFeatureExtractor() = default;

    /**
     * @brief Queue captured audio for the next tick
     *
     * Frames may arrive at any cadence; they are aggregated until tick().
     */
    virtual void push(const AudioFrame& frame) = 0;

    /**
     * @brief Analyze everything pushed since the last tick
     * @param assistant_playing Raises the speaking threshold against leakage
     */
    virtual AudioFeatures tick(bool assistant_playing) = 0;

    /**
     * @brief Forget counters and pending audio
     */
    virtual void reset() = 0;

    virtual Stats get_stats() const = 0;

    virtual bool is_speech() const = 0;
};

} // namespace vad
} // namespace turnkeeper
