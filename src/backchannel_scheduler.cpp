#include "backchannel_scheduler.h"
#include "logger.h"

namespace turnkeeper {

BackchannelScheduler::BackchannelScheduler(const config::BackchannelConfig& config,
                                           IPlaybackDevice* device)
    : config_(config)
    , device_(device) {}

bool BackchannelScheduler::should_fire(const AudioFeatures& features, bool assistant_playing,
                                       bool finalizing, const ConversationContext& context,
                                       TimePoint now) const {
    if (!config_.enabled || config_.phrases.empty()) return false;
    if (assistant_playing || finalizing) return false;
    if (!features.is_speaking || features.silence_duration_ms != 0) return false;
    if (features.speech_duration_ms < config_.min_user_speech_ms) return false;

    if (context.last_backchannel) {
        if (ms_between(*context.last_backchannel, now) < config_.min_interval_ms) return false;
    }
    return true;
}

std::optional<std::string> BackchannelScheduler::tick(const AudioFeatures& features,
                                                      bool assistant_playing, bool finalizing,
                                                      ConversationContext& context,
                                                      TimePoint now) {
    if (!should_fire(features, assistant_playing, finalizing, context, now)) {
        return std::nullopt;
    }

    std::string phrase = config_.phrases[next_phrase_ % config_.phrases.size()];
    next_phrase_++;
    fired_++;
    context.last_backchannel = now;
    inhibit_until_ = now + Duration(config_.inhibit_ms);

    if (device_) {
        device_->play_cue(phrase);
    }
    LOG_BACKCHANNEL("Cue \"" + phrase + "\" after " +
                    std::to_string(features.speech_duration_ms) + "ms of user speech");
    return phrase;
}

bool BackchannelScheduler::inhibiting(TimePoint now) const {
    return inhibit_until_ && now < *inhibit_until_;
}

} // namespace turnkeeper
