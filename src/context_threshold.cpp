#include "context_threshold.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>

namespace turnkeeper {

ContextAwareThreshold::ContextAwareThreshold(int base_threshold_ms,
                                             const config::ContextThresholdConfig& config)
    : base_ms_(base_threshold_ms)
    , current_ms_(base_threshold_ms)
    , config_(config) {}

int ContextAwareThreshold::calculate(const ThresholdContext& context) {
    double threshold = base_ms_;
    std::ostringstream adjustments;

    if (context.is_question.value_or(false)) {
        threshold *= 0.8;
        adjustments << " question(-20%)";
    }

    if (context.transcript_length) {
        if (*context.transcript_length > 100) {
            threshold *= 1.3;
            adjustments << " long(+30%)";
        } else if (*context.transcript_length > 50) {
            threshold *= 1.1;
            adjustments << " medium(+10%)";
        }
    }

    if (context.words_per_second) {
        float wps = *context.words_per_second;
        if (wps < 2.0f) {
            threshold *= 1.5;
            adjustments << " slow(+50%)";
        } else if (wps < 3.0f) {
            threshold *= 1.2;
            adjustments << " moderate(+20%)";
        } else if (wps > 4.5f) {
            threshold *= 0.9;
            adjustments << " fast(-10%)";
        }
    }

    if (context.turn_number) {
        if (*context.turn_number < 3) {
            threshold *= 1.4;
            adjustments << " early(+40%)";
        } else if (*context.turn_number < 5) {
            threshold *= 1.2;
            adjustments << " rapport(+20%)";
        }
    }

    if (context.noise_level) {
        if (*context.noise_level > 0.5f) {
            threshold *= 1.4;
            adjustments << " noisy(+40%)";
        } else if (*context.noise_level > 0.3f) {
            threshold *= 1.2;
            adjustments << " some-noise(+20%)";
        }
    }

    if (context.interruption_rate && *context.interruption_rate > 0.3f) {
        threshold *= 1.3;
        adjustments << " interrupted-often(+30%)";
    }

    if (context.average_turn_words && *context.average_turn_words > 20.0f) {
        threshold *= 1.2;
        adjustments << " long-turns(+20%)";
    }

    current_ms_ = std::max(config_.min_threshold_ms,
                           std::min(config_.max_threshold_ms,
                                    static_cast<int>(std::lround(threshold))));

    LOG_FUSION("Context threshold " + std::to_string(base_ms_) + "ms -> " +
               std::to_string(current_ms_) + "ms" + adjustments.str());
    return current_ms_;
}

bool ContextAwareThreshold::is_question(const std::string& transcript) {
    if (transcript.find('?') != std::string::npos) return true;

    static const std::regex question_start(
        R"(^(who|what|when|where|why|how|which|whose|whom|do|does|did|is|are|was|were|can|could|will|would|should|may|might)\b)");
    return std::regex_search(utils::clean_copy(transcript), question_start);
}

float ContextAwareThreshold::estimate_speaking_rate(const std::string& transcript, int64_t duration_ms) {
    if (duration_ms <= 0) return 0.0f;
    return static_cast<float>(utils::count_words(transcript)) /
           (static_cast<float>(duration_ms) / 1000.0f);
}

float ContextAwareThreshold::estimate_noise_level(const std::vector<float>& rms_values) {
    if (rms_values.empty()) return 0.0f;

    double mean = 0.0;
    for (float v : rms_values) mean += v;
    mean /= rms_values.size();

    double variance = 0.0;
    for (float v : rms_values) variance += (v - mean) * (v - mean);
    variance /= rms_values.size();

    return static_cast<float>(std::min(1.0, std::sqrt(variance) * 20.0));
}

} // namespace turnkeeper
