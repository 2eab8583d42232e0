#pragma once

/**
 * @file interruption_classifier.h
 * @brief Labels user speech bursts that overlap assistant playback
 *
 * Per burst, in order:
 * 1. short + quiet + acknowledgment cue      => BACKCHANNEL (playback continues)
 * 2. topic-shift phrase                      => TOPIC_SHIFT
 * 3. pause phrase                            => PAUSE
 * 4. correction phrase                       => CORRECTION
 * 5. sustained speech at moderate intensity  => INTERRUPTION
 * 6. too many of the above in the window     => IMPATIENCE (advisory, in addition)
 *
 * Phrase verdicts (2-4) wait until the burst is sustained. A burst that may
 * still turn out to be a backchannel is not cut short by rule 5.
 */

#include "core/config.h"
#include "core/types.h"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace turnkeeper {

class InterruptionClassifier {
public:
    explicit InterruptionClassifier(const config::InterruptionConfig& config = {});

    /**
     * @brief Feed one tick of features while assistant audio is active
     * @param partial_transcript Latest transcript of the overlapping speech, if any
     * @param current_chunk Chunk playing when the tick was captured
     * @param context Interruption counters, updated on every floor claim
     * @return Zero, one, or two events (a verdict plus IMPATIENCE)
     */
    std::vector<InterruptionEvent> observe(const AudioFeatures& features,
                                           const std::optional<std::string>& partial_transcript,
                                           std::optional<uint32_t> current_chunk,
                                           ConversationContext& context,
                                           TimePoint now = Clock::now());

    /**
     * @brief Drop the burst in progress (playback stopped under it)
     */
    void reset_burst();

    /**
     * @brief Playback ran to completion: the interruption streak is over
     */
    void on_playback_completed(ConversationContext& context);

    /**
     * @brief Phrase-only classification
     * @return TOPIC_SHIFT, PAUSE, CORRECTION or NONE
     */
    static InterruptionEvent classify_text(const std::string& transcript);

    /**
     * @brief "continue", "go on", "okay, go ahead", "i'm ready", ...
     */
    static bool detect_resume_intent(const std::string& transcript);

    /**
     * @brief Does the transcript consist only of acknowledgment tokens?
     */
    bool is_acknowledgment(const std::string& transcript) const;

    /**
     * @brief Shortest utterance kept for transcription
     * @param paused Control words while paused are allowed to be shorter
     */
    int min_utterance_ms(bool paused) const;

    /// Floor claims inside the impatience window ending at now
    int recent_interruptions(TimePoint now) const;

private:
    struct Burst {
        bool active = false;
        bool decided = false;
        int64_t duration_ms = 0;
        double intensity_sum = 0.0;
        double frequency_sum = 0.0;
        int ticks = 0;
        std::optional<std::string> transcript;
    };

    std::vector<InterruptionEvent> evaluate(bool completed,
                                            std::optional<uint32_t> current_chunk,
                                            ConversationContext& context,
                                            TimePoint now);

    void record_floor_claim(ConversationContext& context, TimePoint now,
                            std::vector<InterruptionEvent>& events,
                            std::optional<uint32_t> current_chunk);

    config::InterruptionConfig config_;
    Burst burst_;
    std::deque<TimePoint> recent_;
};

} // namespace turnkeeper
