#pragma once

/**
 * @file backchannel_scheduler.h
 * @brief Occasional "mm-hmm" from the assistant while the user holds the floor
 *
 * A cue fires only when the user has been talking continuously for a while,
 * the last cue is long enough ago, the assistant is silent and no transcript
 * is being finalized. After a cue, microphone audio is kept away from the
 * transcriber for a short inhibit window so the cue is not transcribed.
 */

#include "collaborators.h"
#include "core/config.h"
#include "core/types.h"
#include <optional>
#include <string>

namespace turnkeeper {

class BackchannelScheduler {
public:
    BackchannelScheduler(const config::BackchannelConfig& config, IPlaybackDevice* device);

    /**
     * @brief True if every firing condition holds right now
     */
    bool should_fire(const AudioFeatures& features, bool assistant_playing,
                     bool finalizing, const ConversationContext& context,
                     TimePoint now) const;

    /**
     * @brief Play the next phrase if should_fire(); records the time in context
     * @return Phrase played, if any
     */
    std::optional<std::string> tick(const AudioFeatures& features, bool assistant_playing,
                                    bool finalizing, ConversationContext& context,
                                    TimePoint now = Clock::now());

    /// Inside the post-cue window where capture must not reach the transcriber
    bool inhibiting(TimePoint now) const;

    int fired_count() const { return fired_; }

private:
    config::BackchannelConfig config_;
    IPlaybackDevice* device_;
    size_t next_phrase_ = 0;
    std::optional<TimePoint> inhibit_until_;
    int fired_ = 0;
};

} // namespace turnkeeper
