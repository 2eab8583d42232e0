/**
 * @file feature_extractor.cpp
 * @brief Energy-based feature extractor implementation
 */

#include "vad/feature_extractor.h"
#include "core/ring_buffer.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace turnkeeper {
namespace vad {

float compute_rms(const AudioBuffer& samples) {
    if (samples.empty()) return 0.0f;

    double sum_sq = 0.0;
    for (Sample s : samples) {
        double normalized = static_cast<double>(s) / 32768.0;
        sum_sq += normalized * normalized;
    }
    double rms = std::sqrt(sum_sq / samples.size());
    return static_cast<float>(std::min(rms, 1.0));
}

float estimate_pitch_trend(const AudioBuffer& samples, int max_window) {
    size_t window = std::min(static_cast<size_t>(std::max(max_window, 0)), samples.size() / 2);
    if (window == 0) return 0.0f;

    double first_energy = 0.0;
    double last_energy = 0.0;
    size_t last_start = samples.size() - window;
    for (size_t i = 0; i < window; ++i) {
        double a = samples[i] / 32768.0;
        double b = samples[last_start + i] / 32768.0;
        first_energy += a * a;
        last_energy += b * b;
    }

    // Rising energy tracks rising pitch closely enough for turn cues
    double change = (last_energy - first_energy) / (first_energy + 1e-10);
    return static_cast<float>(std::max(-1.0, std::min(1.0, change * 10.0)));
}

size_t count_zero_crossings(const AudioBuffer& samples) {
    size_t crossings = 0;
    for (size_t i = 1; i < samples.size(); ++i) {
        bool prev_neg = samples[i - 1] < 0;
        bool cur_neg = samples[i] < 0;
        if (prev_neg != cur_neg) {
            ++crossings;
        }
    }
    return crossings;
}

/**
 * @brief Implementation details for FeatureExtractor
 */
class FeatureExtractor::Impl {
public:
    explicit Impl(const config::FeatureConfig& config)
        : config_(config)
        , history_(static_cast<size_t>(std::max(config.pitch_window_samples, 1)) * 2)
    {
        std::ostringstream oss;
        oss << "FeatureExtractor initialized: threshold=" << config.speaking_threshold
            << ", playback_multiplier=" << config.playback_threshold_multiplier
            << ", tick=" << config.tick_ms << "ms"
            << ", pitch_window=" << config.pitch_window_samples;
        LOG_VAD(oss.str());
    }

    void push(const AudioFrame& frame) {
        pending_.insert(pending_.end(), frame.begin(), frame.end());
    }

    AudioFeatures tick(bool assistant_playing) {
        AudioBuffer buffer;
        buffer.swap(pending_);

        float threshold = config_.speaking_threshold;
        if (assistant_playing) {
            threshold *= config_.playback_threshold_multiplier;
        }
        stats_.threshold = threshold;
        stats_.ticks++;

        AudioFeatures features;
        if (buffer.empty()) {
            // Nothing captured this tick: degrade to silence
            stats_.empty_ticks++;
            features.speaking_rate_hz = constants::features::MIN_SPEAKING_RATE_HZ;
        } else {
            features.intensity_rms = compute_rms(buffer);
            history_.write_overwrite(buffer);
            features.pitch_trend = estimate_pitch_trend(history_.peek_all(),
                                                        config_.pitch_window_samples);

            size_t crossings = count_zero_crossings(buffer);
            double seconds = static_cast<double>(buffer.size()) / config_.sample_rate;
            double half_crossings_hz = (crossings / 2.0) / seconds;
            features.dominant_frequency_hz = static_cast<float>(half_crossings_hz);
            features.speaking_rate_hz = static_cast<float>(std::max<double>(
                constants::features::MIN_SPEAKING_RATE_HZ,
                std::min<double>(constants::features::MAX_SPEAKING_RATE_HZ,
                                 half_crossings_hz / constants::features::RATE_SCALE)));
        }

        stats_.current_rms = features.intensity_rms;
        features.is_speaking = features.intensity_rms > threshold;

        if (features.is_speaking) {
            if (!speaking_) {
                std::ostringstream oss;
                oss << "Speech start: rms=" << features.intensity_rms
                    << " threshold=" << threshold
                    << " after " << silence_ms_ << "ms silence";
                LOG_VAD(oss.str());
            }
            silence_ms_ = 0;
            speech_ms_ += config_.tick_ms;
        } else {
            if (speaking_) {
                LOG_VAD("Speech end after " + std::to_string(speech_ms_) + "ms");
            }
            speech_ms_ = 0;
            silence_ms_ += config_.tick_ms;
        }
        speaking_ = features.is_speaking;

        features.silence_duration_ms = silence_ms_;
        features.speech_duration_ms = speech_ms_;
        stats_.silence_duration_ms = silence_ms_;
        stats_.speech_duration_ms = speech_ms_;
        return features;
    }

    void reset() {
        pending_.clear();
        history_.clear();
        silence_ms_ = 0;
        speech_ms_ = 0;
        speaking_ = false;
        stats_ = Stats{};
    }

    Stats get_stats() const {
        Stats stats = stats_;
        stats.pending_samples = pending_.size();
        return stats;
    }

    bool is_speech() const { return speaking_; }

private:
    config::FeatureConfig config_;
    AudioBuffer pending_;
    AudioRingBuffer history_;
    int64_t silence_ms_ = 0;
    int64_t speech_ms_ = 0;
    bool speaking_ = false;
    Stats stats_;
};

// =============================================================================
// FeatureExtractor Public Interface
// =============================================================================

FeatureExtractor::FeatureExtractor(const config::FeatureConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

FeatureExtractor::~FeatureExtractor() = default;

void FeatureExtractor::push(const AudioFrame& frame) {
    impl_->push(frame);
}

AudioFeatures FeatureExtractor::tick(bool assistant_playing) {
    return impl_->tick(assistant_playing);
}

AudioFeatures FeatureExtractor::analyze(const AudioBuffer& buffer, bool assistant_playing) {
    impl_->push(buffer);
    return impl_->tick(assistant_playing);
}

void FeatureExtractor::reset() {
    impl_->reset();
}

Stats FeatureExtractor::get_stats() const {
    return impl_->get_stats();
}

bool FeatureExtractor::is_speech() const {
    return impl_->is_speech();
}

} // namespace vad
} // namespace turnkeeper
