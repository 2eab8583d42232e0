#pragma once

/**
 * @file decision_recorder.h
 * @brief JSON-lines log of turn decisions, interruptions and session changes
 *
 * One file per recording run, <record_dir>/<run-id>.jsonl, one object per
 * line: {"t_ms", "session", "event", "data"}. Used offline to tune the
 * thresholds.
 */

#include "cancellation.h"
#include "core/types.h"
#include "errors.h"
#include <memory>
#include <string>

namespace turnkeeper {

class DecisionRecorder {
public:
    explicit DecisionRecorder(const std::string& record_dir);
    ~DecisionRecorder();

    /**
     * @brief Create the directory and open a new run file
     */
    Result<void> start();

    /// Flush and close
    void finish();

    bool is_recording() const;

    /// Run id, also the file stem
    std::string get_run_id() const;
    std::string get_path() const;

    void record_decision(SessionId session, const std::string& transcript,
                         const TurnDecision& decision);
    void record_interruption(SessionId session, const InterruptionEvent& event);
    void record_transition(SessionId session, PlaybackState from, PlaybackState to);
    void record_event(SessionId session, const std::string& event_type, const std::string& data);

    size_t records_written() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace turnkeeper
