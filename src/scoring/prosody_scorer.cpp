/**
 * @file prosody_scorer.cpp
 * @brief Heuristic hold/shift projection implementation
 */

#include "scoring/prosody_scorer.h"
#include "logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace turnkeeper {
namespace scoring {

namespace {

/// Positive delta favours shift, negative favours hold
void nudge(float delta, float& hold, float& shift) {
    shift += delta;
    hold -= delta;
}

float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

} // anonymous namespace

ProsodyPrediction ProsodyScorer::score(const AudioFeatures& features) {
    float hold = 0.5f;
    float shift = 0.5f;

    if (features.silence_duration_ms > 2000) {
        nudge(0.3f, hold, shift);
    } else if (features.silence_duration_ms > 1000) {
        nudge(0.2f, hold, shift);
    } else if (features.silence_duration_ms > 500) {
        nudge(0.1f, hold, shift);
    }

    if (features.pitch_trend < -0.2f) {
        nudge(0.15f, hold, shift);
    } else if (features.pitch_trend > 0.2f) {
        nudge(-0.15f, hold, shift);
    }

    if (features.intensity_rms < 0.02f) {
        nudge(0.1f, hold, shift);
    } else if (features.intensity_rms > 0.08f) {
        nudge(-0.1f, hold, shift);
    }

    if (features.speaking_rate_hz < 2.5f) {
        nudge(0.1f, hold, shift);
    } else if (features.speaking_rate_hz > 4.0f) {
        nudge(-0.1f, hold, shift);
    }

    hold = clamp01(hold);
    shift = clamp01(shift);
    float total = hold + shift;

    ProsodyPrediction prediction;
    if (total > 0.0f) {
        prediction.hold = hold / total;
        prediction.shift = shift / total;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "VAP hold=" << prediction.hold << " shift=" << prediction.shift
        << " (silence=" << features.silence_duration_ms << "ms"
        << " pitch=" << features.pitch_trend
        << " intensity=" << std::setprecision(3) << features.intensity_rms
        << " rate=" << std::setprecision(1) << features.speaking_rate_hz << ")";
    LOG_SCORE(oss.str());

    return prediction;
}

} // namespace scoring
} // namespace turnkeeper
