#pragma once

/**
 * @file context_threshold.h
 * @brief Fallback silence threshold scaled by conversation context
 */

#include "core/config.h"
#include <optional>
#include <string>
#include <vector>

namespace turnkeeper {

/**
 * @brief Observations feeding the threshold; unset fields are ignored
 */
struct ThresholdContext {
    std::optional<bool> is_question;
    std::optional<size_t> transcript_length;    ///< Characters
    std::optional<float> words_per_second;
    std::optional<int> turn_number;
    std::optional<float> noise_level;           ///< [0,1]
    std::optional<float> interruption_rate;     ///< Interruptions per turn
    std::optional<float> average_turn_words;
};

class ContextAwareThreshold {
public:
    ContextAwareThreshold(int base_threshold_ms, const config::ContextThresholdConfig& config);

    /**
     * @brief Multiply the base threshold by every applicable factor
     * @return Threshold clamped to [min_threshold_ms, max_threshold_ms]
     */
    int calculate(const ThresholdContext& context);

    int base() const { return base_ms_; }
    int current() const { return current_ms_; }

    /// Question mark, or a wh-word / auxiliary verb at the start
    static bool is_question(const std::string& transcript);

    /// Words per second over the utterance duration; 0 when duration is 0
    static float estimate_speaking_rate(const std::string& transcript, int64_t duration_ms);

    /// Standard deviation of recent RMS values scaled into [0,1]
    static float estimate_noise_level(const std::vector<float>& rms_values);

private:
    int base_ms_;
    int current_ms_;
    config::ContextThresholdConfig config_;
};

} // namespace turnkeeper
