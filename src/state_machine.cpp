#include "state_machine.h"
#include "logger.h"

namespace turnkeeper {

class PlaybackStateMachine::Impl {
public:
    PlaybackState get_state() const {
        return state_;
    }

    bool apply(PlaybackEvent event) {
        PlaybackState next = state_;
        if (!transition(event, next)) {
            LOG_QUEUE(std::string("Ignored ") + playback_event_to_string(event) +
                      " in " + playback_state_to_string(state_));
            return false;
        }
        if (next != state_) {
            LOG_QUEUE(std::string(playback_state_to_string(state_)) + " -> " +
                      playback_state_to_string(next));
        }
        state_ = next;
        return true;
    }

    bool can_apply(PlaybackEvent event) const {
        PlaybackState next = state_;
        return transition(event, next);
    }

private:
    bool transition(PlaybackEvent event, PlaybackState& next) const {
        switch (state_) {
            case PlaybackState::Idle:
                if (event == PlaybackEvent::ChunkStarted) { next = PlaybackState::Playing; return true; }
                if (event == PlaybackEvent::FinalChunkDone) { next = PlaybackState::Completed; return true; }
                if (event == PlaybackEvent::Abort) { next = PlaybackState::Aborted; return true; }
                return false;

            case PlaybackState::Playing:
                // Next chunk starting keeps the session playing
                if (event == PlaybackEvent::ChunkStarted) { return true; }
                if (event == PlaybackEvent::Pause) { next = PlaybackState::Paused; return true; }
                if (event == PlaybackEvent::FinalChunkDone) { next = PlaybackState::Completed; return true; }
                if (event == PlaybackEvent::Abort) { next = PlaybackState::Aborted; return true; }
                return false;

            case PlaybackState::Paused:
                if (event == PlaybackEvent::Resume) { next = PlaybackState::Playing; return true; }
                if (event == PlaybackEvent::Abort) { next = PlaybackState::Aborted; return true; }
                return false;

            case PlaybackState::Aborted:
            case PlaybackState::Completed:
                return false;
        }
        return false;
    }

    PlaybackState state_ = PlaybackState::Idle;
};

PlaybackStateMachine::PlaybackStateMachine()
    : pimpl_(std::make_unique<Impl>()) {}

PlaybackStateMachine::~PlaybackStateMachine() = default;

PlaybackState PlaybackStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool PlaybackStateMachine::apply(PlaybackEvent event) {
    return pimpl_->apply(event);
}

bool PlaybackStateMachine::can_apply(PlaybackEvent event) const {
    return pimpl_->can_apply(event);
}

} // namespace turnkeeper
