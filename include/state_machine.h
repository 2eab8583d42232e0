#pragma once

#include "core/types.h"
#include <memory>

namespace turnkeeper {

/**
 * @brief Event driving a playback session
 */
enum class PlaybackEvent {
    ChunkStarted,      ///< A chunk reached the device
    Pause,
    Resume,
    Abort,
    FinalChunkDone     ///< The last chunk of the reply finished playing
};

inline const char* playback_event_to_string(PlaybackEvent event) {
    switch (event) {
        case PlaybackEvent::ChunkStarted: return "ChunkStarted";
        case PlaybackEvent::Pause: return "Pause";
        case PlaybackEvent::Resume: return "Resume";
        case PlaybackEvent::Abort: return "Abort";
        case PlaybackEvent::FinalChunkDone: return "FinalChunkDone";
    }
    return "Unknown";
}

/**
 * @brief Playback session lifecycle
 *
 * - Idle -> Playing (ChunkStarted)
 * - Idle -> Completed (FinalChunkDone, empty reply)
 * - Playing -> Paused (Pause), Paused -> Playing (Resume)
 * - Playing -> Completed (FinalChunkDone)
 * - Idle | Playing | Paused -> Aborted (Abort)
 * - Aborted and Completed are terminal; every event is rejected there
 */
class PlaybackStateMachine {
public:
    PlaybackStateMachine();
    ~PlaybackStateMachine();

    PlaybackState get_state() const;

    /**
     * @brief Apply an event
     * @return False (state unchanged) if the event is not valid in the current state
     */
    bool apply(PlaybackEvent event);

    /**
     * @brief Would apply() accept this event?
     */
    bool can_apply(PlaybackEvent event) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace turnkeeper
