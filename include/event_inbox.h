#pragma once

/**
 * @file event_inbox.h
 * @brief The one structure shared between collaborator threads and the tick
 */

#include "collaborators.h"
#include <mutex>
#include <vector>

namespace turnkeeper {

class EventInbox : public IEventSink {
public:
    void post(CollaboratorEvent event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    /**
     * @brief Take every event posted so far, in posting order
     */
    std::vector<CollaboratorEvent> drain() {
        std::vector<CollaboratorEvent> drained;
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(events_);
        return drained;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<CollaboratorEvent> events_;
};

} // namespace turnkeeper
