#pragma once

/**
 * @file feature_extractor.h
 * @brief Energy-based feature extractor
 *
 * Per tick:
 * - RMS intensity against a threshold raised while assistant audio plays
 * - Silence and speech burst durations advanced by the tick interval
 * - Pitch trend from the energy slope across a rolling window
 * - Speaking rate and dominant frequency from zero crossings
 */

#include "vad_interface.h"
#include "core/config.h"
#include <memory>

namespace turnkeeper {
namespace vad {

class FeatureExtractor : public IFeatureExtractor {
public:
    explicit FeatureExtractor(const config::FeatureConfig& config = {});
    ~FeatureExtractor() override;

    void push(const AudioFrame& frame) override;
    AudioFeatures tick(bool assistant_playing) override;
    void reset() override;
    Stats get_stats() const override;
    bool is_speech() const override;

    /**
     * @brief push() + tick() for callers holding a whole tick of audio
     */
    AudioFeatures analyze(const AudioBuffer& buffer, bool assistant_playing);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Signal helpers, exposed for tests

/// RMS of 16-bit samples normalized to [0,1]; 0 for an empty buffer
float compute_rms(const AudioBuffer& samples);

/// Energy slope between the first and last window, clamped to [-1,1]
float estimate_pitch_trend(const AudioBuffer& samples, int max_window);

size_t count_zero_crossings(const AudioBuffer& samples);

} // namespace vad
} // namespace turnkeeper
