#include "interruption_classifier.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

namespace turnkeeper {

namespace {

struct PhraseRule {
    std::regex pattern;
    InterruptionType type;
    float confidence;
    const char* reason;
};

/// Topic shifts first so "wait, what about..." is not read as a pause
const std::vector<PhraseRule>& phrase_rules() {
    static const std::vector<PhraseRule> rules = {
        {std::regex(R"(^(actually|wait|hold on),?\s+(what about|how about|instead|let's talk about)\b)"),
         InterruptionType::TopicShift, 0.9f, "user shifted the topic"},
        {std::regex(R"(^(never mind|forget that|change of plans)\b)"),
         InterruptionType::TopicShift, 0.9f, "user shifted the topic"},
        {std::regex(R"(^(by the way|also|oh|speaking of)\b)"),
         InterruptionType::TopicShift, 0.9f, "user shifted the topic"},
        {std::regex(R"(^(wait|hold on|hold up|stop|pause|hang on)\b)"),
         InterruptionType::Pause, 0.95f, "user requested a pause"},
        {std::regex(R"(^(one second|one moment|just a sec|just a moment)\b)"),
         InterruptionType::Pause, 0.95f, "user requested a pause"},
        {std::regex(R"(^(no|nope|not|incorrect|wrong)\b)"),
         InterruptionType::Correction, 0.92f, "user is correcting the assistant"},
        {std::regex(R"(^(i said|i meant|i mean|what i meant was)\b)"),
         InterruptionType::Correction, 0.92f, "user is correcting the assistant"},
        {std::regex(R"(^(listen|hear me|let me clarify)\b)"),
         InterruptionType::Correction, 0.92f, "user is correcting the assistant"},
        {std::regex(R"(^(that's not|that isn't|you misunderstood)\b)"),
         InterruptionType::Correction, 0.92f, "user is correcting the assistant"},
    };
    return rules;
}

const std::vector<std::regex>& resume_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^(continue|go on|go ahead|keep going|proceed)\b)"),
        std::regex(R"(^(okay|ok|alright|sure),?\s+(continue|go on|go ahead)\b)"),
        std::regex(R"(^(i'm ready|ready now)\b)"),
    };
    return patterns;
}

constexpr float BACKCHANNEL_SHORT_WEIGHT = 0.4f;
constexpr float BACKCHANNEL_QUIET_WEIGHT = 0.4f;
constexpr float BACKCHANNEL_CUE_WEIGHT = 0.2f;
constexpr float BARGE_IN_CONFIDENCE = 0.7f;
constexpr float IMPATIENCE_CONFIDENCE = 0.85f;

} // anonymous namespace

InterruptionClassifier::InterruptionClassifier(const config::InterruptionConfig& config)
    : config_(config) {}

InterruptionEvent InterruptionClassifier::classify_text(const std::string& transcript) {
    InterruptionEvent event;
    std::string text = utils::clean_copy(transcript);
    if (text.empty()) return event;

    for (const auto& rule : phrase_rules()) {
        if (std::regex_search(text, rule.pattern)) {
            event.type = rule.type;
            event.confidence = rule.confidence;
            event.reason = rule.reason;
            return event;
        }
    }
    return event;
}

bool InterruptionClassifier::detect_resume_intent(const std::string& transcript) {
    std::string text = utils::clean_copy(transcript);
    for (const auto& pattern : resume_patterns()) {
        if (std::regex_search(text, pattern)) return true;
    }
    return false;
}

bool InterruptionClassifier::is_acknowledgment(const std::string& transcript) const {
    std::string text = utils::strip_punctuation(utils::clean_copy(transcript));
    if (text.empty()) return false;

    auto in_lexicon = [this](const std::string& token) {
        return std::find(config_.backchannel_lexicon.begin(),
                         config_.backchannel_lexicon.end(), token) != config_.backchannel_lexicon.end();
    };
    if (in_lexicon(text)) return true;

    // "yeah yeah", "mm, okay": every token must be an acknowledgment
    for (const auto& word : utils::split_words(text)) {
        if (!in_lexicon(utils::strip_punctuation(word))) return false;
    }
    return true;
}

int InterruptionClassifier::min_utterance_ms(bool paused) const {
    return paused ? config_.paused_min_utterance_ms : config_.min_utterance_ms;
}

int InterruptionClassifier::recent_interruptions(TimePoint now) const {
    return static_cast<int>(std::count_if(recent_.begin(), recent_.end(), [&](TimePoint t) {
        return ms_between(t, now) <= config_.impatience_window_ms;
    }));
}

void InterruptionClassifier::reset_burst() {
    burst_ = Burst{};
}

void InterruptionClassifier::on_playback_completed(ConversationContext& context) {
    context.consecutive_interruptions = 0;
}

std::vector<InterruptionEvent> InterruptionClassifier::observe(
        const AudioFeatures& features,
        const std::optional<std::string>& partial_transcript,
        std::optional<uint32_t> current_chunk,
        ConversationContext& context,
        TimePoint now) {
    if (partial_transcript && !utils::is_empty_or_whitespace(*partial_transcript)) {
        burst_.transcript = partial_transcript;
    }

    if (features.is_speaking) {
        burst_.active = true;
        burst_.duration_ms = std::max(burst_.duration_ms, features.speech_duration_ms);
        burst_.intensity_sum += features.intensity_rms;
        burst_.frequency_sum += features.dominant_frequency_hz;
        burst_.ticks++;
        if (burst_.decided) return {};
        return evaluate(false, current_chunk, context, now);
    }

    if (!burst_.active) {
        // Transcript without audio belongs to the next burst
        return {};
    }

    std::vector<InterruptionEvent> events;
    if (!burst_.decided) {
        events = evaluate(true, current_chunk, context, now);
    }
    burst_ = Burst{};
    return events;
}

std::vector<InterruptionEvent> InterruptionClassifier::evaluate(bool completed,
                                                                std::optional<uint32_t> current_chunk,
                                                                ConversationContext& context,
                                                                TimePoint now) {
    std::vector<InterruptionEvent> events;
    float intensity = burst_.ticks > 0 ? static_cast<float>(burst_.intensity_sum / burst_.ticks) : 0.0f;
    float frequency = burst_.ticks > 0 ? static_cast<float>(burst_.frequency_sum / burst_.ticks) : 0.0f;
    bool sustained = burst_.duration_ms >= config_.barge_in_threshold_ms;

    InterruptionEvent verdict;
    verdict.during_chunk = current_chunk;

    if (config_.enabled) {
        bool is_short = burst_.duration_ms < config_.backchannel_max_ms;
        bool quiet = intensity < config_.backchannel_max_intensity;
        bool cue = burst_.transcript
            ? is_acknowledgment(*burst_.transcript)
            : (frequency > config_.nasal_min_hz && frequency < config_.nasal_max_hz);
        InterruptionEvent phrase = burst_.transcript ? classify_text(*burst_.transcript)
                                                     : InterruptionEvent{};

        if (is_short && quiet && cue && phrase.type == InterruptionType::None) {
            if (!completed) {
                return events;  // may still be a backchannel
            }
            verdict.type = InterruptionType::Backchannel;
            verdict.confidence = BACKCHANNEL_SHORT_WEIGHT + BACKCHANNEL_QUIET_WEIGHT + BACKCHANNEL_CUE_WEIGHT;
            verdict.reason = burst_.transcript ? "short quiet acknowledgment" : "short quiet nasal sound";
            burst_.decided = true;

            std::ostringstream oss;
            oss << "BACKCHANNEL " << burst_.duration_ms << "ms rms=" << std::setprecision(3) << intensity
                << " (" << verdict.reason << ")";
            LOG_BARGE(oss.str());
            events.push_back(verdict);
            return events;
        }

        if (phrase.type != InterruptionType::None) {
            if (!sustained) {
                return events;  // held until the burst qualifies
            }
            verdict.type = phrase.type;
            verdict.confidence = phrase.confidence;
            verdict.reason = phrase.reason;
            burst_.decided = true;
            LOG_BARGE(std::string(interruption_type_to_string(verdict.type)) + ": \"" +
                      *burst_.transcript + "\"");
            events.push_back(verdict);
            // A pause holds the reply; it does not take the floor
            if (verdict.type != InterruptionType::Pause || !config_.enable_pause_resume) {
                record_floor_claim(context, now, events, current_chunk);
            }
            return events;
        }
    }

    if (sustained && intensity >= config_.interruption_min_intensity) {
        verdict.type = InterruptionType::Interruption;
        verdict.confidence = BARGE_IN_CONFIDENCE;
        verdict.reason = "user spoke over playback for " + std::to_string(burst_.duration_ms) + "ms";
        burst_.decided = true;
        LOG_BARGE("INTERRUPTION: " + verdict.reason);
        events.push_back(verdict);
        record_floor_claim(context, now, events, current_chunk);
    }
    return events;
}

void InterruptionClassifier::record_floor_claim(ConversationContext& context, TimePoint now,
                                                std::vector<InterruptionEvent>& events,
                                                std::optional<uint32_t> current_chunk) {
    context.consecutive_interruptions++;
    context.total_interruptions++;
    context.last_interruption = now;

    recent_.push_back(now);
    while (!recent_.empty() && ms_between(recent_.front(), now) > config_.impatience_window_ms) {
        recent_.pop_front();
    }

    if (!config_.enabled) return;

    int count = static_cast<int>(recent_.size());
    if (count >= config_.impatience_count) {
        InterruptionEvent impatience;
        impatience.type = InterruptionType::Impatience;
        impatience.confidence = IMPATIENCE_CONFIDENCE;
        impatience.during_chunk = current_chunk;
        impatience.reason = std::to_string(count) + " interruptions within " +
                            std::to_string(config_.impatience_window_ms / 1000) + "s";
        LOG_BARGE("IMPATIENCE: " + impatience.reason);
        events.push_back(impatience);
    }
}

} // namespace turnkeeper
