#pragma once

/**
 * @file ducking_controller.h
 * @brief Lowers assistant volume while the user talks over it
 */

#include "core/config.h"
#include "core/types.h"

namespace turnkeeper {

enum class DuckLevel {
    Silence,      ///< User quiet, full volume
    Backchannel,  ///< Short, quiet burst
    Tentative,    ///< Speech that has not yet lasted long enough to be clear
    Clear         ///< Sustained speech
};

inline const char* duck_level_to_string(DuckLevel level) {
    switch (level) {
        case DuckLevel::Silence: return "SILENCE";
        case DuckLevel::Backchannel: return "BACKCHANNEL";
        case DuckLevel::Tentative: return "TENTATIVE";
        case DuckLevel::Clear: return "CLEAR";
    }
    return "UNKNOWN";
}

class DuckingController {
public:
    explicit DuckingController(const config::DuckingConfig& config = {});

    DuckLevel classify(const AudioFeatures& features) const;

    float target_volume(DuckLevel level) const;

    /**
     * @brief Step the volume toward the target for this tick
     * @return New volume
     */
    float update(const AudioFeatures& features);

    /// Back to full volume, for a new session
    void reset();

    float volume() const { return volume_; }
    DuckLevel level() const { return level_; }

private:
    config::DuckingConfig config_;
    float volume_;
    DuckLevel level_ = DuckLevel::Silence;
};

} // namespace turnkeeper
