#include "ducking_controller.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace turnkeeper {

DuckingController::DuckingController(const config::DuckingConfig& config)
    : config_(config)
    , volume_(config.silence_volume) {}

DuckLevel DuckingController::classify(const AudioFeatures& features) const {
    if (!features.is_speaking) {
        return DuckLevel::Silence;
    }
    if (features.speech_duration_ms < config_.backchannel_max_ms &&
        features.intensity_rms < config_.backchannel_max_intensity) {
        return DuckLevel::Backchannel;
    }
    if (features.speech_duration_ms < config_.clear_min_ms) {
        return DuckLevel::Tentative;
    }
    return DuckLevel::Clear;
}

float DuckingController::target_volume(DuckLevel level) const {
    switch (level) {
        case DuckLevel::Silence: return config_.silence_volume;
        case DuckLevel::Backchannel: return config_.backchannel_volume;
        case DuckLevel::Tentative: return config_.tentative_volume;
        case DuckLevel::Clear: return config_.clear_volume;
    }
    return config_.silence_volume;
}

float DuckingController::update(const AudioFeatures& features) {
    DuckLevel level = config_.enabled ? classify(features) : DuckLevel::Silence;
    float target = target_volume(level);

    float delta = target - volume_;
    float step = std::min(std::fabs(delta), config_.step_per_tick);
    // Land exactly on the target so steady state stays put
    float next = std::fabs(delta) <= config_.step_per_tick ? target
                 : volume_ + (delta > 0.0f ? step : -step);

    if (level != level_) {
        std::ostringstream oss;
        oss << "[Duck] " << duck_level_to_string(level_) << " -> "
            << duck_level_to_string(level) << " target=" << target;
        LOG_DUCK(oss.str());
        level_ = level;
    }
    volume_ = next;
    return volume_;
}

void DuckingController::reset() {
    volume_ = config_.silence_volume;
    level_ = DuckLevel::Silence;
}

} // namespace turnkeeper
