#pragma once

/**
 * @file cancellation.h
 * @brief Request tickets and the registry that guards late results
 *
 * Every outbound collaborator request carries a ticket. A result is accepted
 * only while its ticket is live; canceling a finished request is a no-op.
 */

#include "common.h"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace turnkeeper {

using RequestId = uint64_t;
using SessionId = uint64_t;

enum class RequestKind {
    Transcription,
    Reply,
    Synthesis,
    FullReplySynthesis
};

inline const char* request_kind_to_string(RequestKind kind) {
    switch (kind) {
        case RequestKind::Transcription: return "transcription";
        case RequestKind::Reply: return "reply";
        case RequestKind::Synthesis: return "synthesis";
        case RequestKind::FullReplySynthesis: return "full-reply-synthesis";
    }
    return "unknown";
}

struct RequestTicket {
    RequestId id = 0;
    SessionId session = 0;
    RequestKind kind = RequestKind::Reply;
    TimePoint issued_at{};
    std::optional<uint32_t> chunk_index;   ///< Synthesis only
};

/**
 * @brief Live tickets of the whole engine
 *
 * Only the tick thread issues, completes and cancels; collaborator threads
 * never touch it (their results are checked when the inbox is drained).
 */
class TicketRegistry {
public:
    RequestTicket issue(SessionId session, RequestKind kind,
                        std::optional<uint32_t> chunk_index = std::nullopt,
                        TimePoint now = Clock::now()) {
        RequestTicket ticket;
        ticket.id = next_id_++;
        ticket.session = session;
        ticket.kind = kind;
        ticket.issued_at = now;
        ticket.chunk_index = chunk_index;
        live_[ticket.id] = ticket;
        return ticket;
    }

    /// Ticket if the request is still awaited by the given session
    std::optional<RequestTicket> find(RequestId id, SessionId session) const {
        auto it = live_.find(id);
        if (it == live_.end() || it->second.session != session) {
            return std::nullopt;
        }
        return it->second;
    }

    bool is_live(RequestId id) const {
        return live_.count(id) > 0;
    }

    /**
     * @brief Retire a request (completed or canceled)
     * @return False if it was not live
     */
    bool retire(RequestId id) {
        return live_.erase(id) > 0;
    }

    /// Retire every ticket of a session and return them for cancellation
    std::vector<RequestTicket> retire_session(SessionId session) {
        std::vector<RequestTicket> retired;
        for (auto it = live_.begin(); it != live_.end();) {
            if (it->second.session == session) {
                retired.push_back(it->second);
                it = live_.erase(it);
            } else {
                ++it;
            }
        }
        return retired;
    }

    /// Restart the timeout clock of a streaming request
    void touch(RequestId id, TimePoint now = Clock::now()) {
        auto it = live_.find(id);
        if (it != live_.end()) {
            it->second.issued_at = now;
        }
    }

    /// Live tickets issued (or last touched) more than timeout_ms before now
    std::vector<RequestTicket> expired(TimePoint now, int timeout_ms) const {
        std::vector<RequestTicket> result;
        for (const auto& entry : live_) {
            if (ms_between(entry.second.issued_at, now) > timeout_ms) {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    size_t live_count() const { return live_.size(); }

    size_t live_count(SessionId session) const {
        size_t count = 0;
        for (const auto& entry : live_) {
            if (entry.second.session == session) ++count;
        }
        return count;
    }

private:
    RequestId next_id_ = 1;
    std::map<RequestId, RequestTicket> live_;
};

} // namespace turnkeeper
