#include "decision_recorder.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace turnkeeper {

using json = nlohmann::json;

class DecisionRecorder::Impl {
public:
    explicit Impl(const std::string& record_dir)
        : record_dir_(record_dir), records_(0) {}

    Result<void> start() {
        std::error_code ec;
        std::filesystem::create_directories(record_dir_, ec);
        if (ec) {
            return make_error(ErrorType::Unknown,
                              "Cannot create record directory " + record_dir_ + ": " + ec.message());
        }

        // Run id from wall-clock timestamp
        auto now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
        run_id_ = ss.str();

        out_.open(get_path(), std::ios::app);
        if (!out_.is_open()) {
            return make_error(ErrorType::Unknown, "Cannot open record file " + get_path());
        }
        start_time_ = Clock::now();
        records_ = 0;
        Logger::info("Recording decisions to " + get_path());
        return Result<void>();
    }

    void finish() {
        if (out_.is_open()) {
            out_.flush();
            out_.close();
        }
    }

    bool is_recording() const { return out_.is_open(); }

    std::string get_run_id() const { return run_id_; }

    std::string get_path() const {
        return record_dir_ + "/" + run_id_ + ".jsonl";
    }

    void write(SessionId session, const std::string& event_type, json data) {
        if (!out_.is_open()) return;
        json line;
        line["t_ms"] = ms_since(start_time_);
        line["session"] = session;
        line["event"] = event_type;
        line["data"] = std::move(data);
        out_ << line.dump() << "\n";
        out_.flush();
        records_++;
    }

    size_t records_written() const { return records_; }

private:
    std::string record_dir_;
    std::string run_id_;
    std::ofstream out_;
    TimePoint start_time_;
    size_t records_;
};

DecisionRecorder::DecisionRecorder(const std::string& record_dir)
    : pimpl_(std::make_unique<Impl>(record_dir)) {}

DecisionRecorder::~DecisionRecorder() {
    pimpl_->finish();
}

Result<void> DecisionRecorder::start() {
    return pimpl_->start();
}

void DecisionRecorder::finish() {
    pimpl_->finish();
}

bool DecisionRecorder::is_recording() const {
    return pimpl_->is_recording();
}

std::string DecisionRecorder::get_run_id() const {
    return pimpl_->get_run_id();
}

std::string DecisionRecorder::get_path() const {
    return pimpl_->get_path();
}

void DecisionRecorder::record_decision(SessionId session, const std::string& transcript,
                                       const TurnDecision& decision) {
    json data;
    data["transcript"] = transcript;
    data["takeTurn"] = decision.take_turn;
    data["method"] = decision_method_to_string(decision.method);
    data["textScore"] = decision.text_score;
    data["audioScore"] = decision.audio_score;
    data["fusedScore"] = decision.fused_score;
    data["confidence"] = decision.confidence;
    if (decision.method == DecisionMethod::Fallback) {
        data["silenceDurationMs"] = decision.breakdown.silence_duration_ms;
        data["thresholdMs"] = decision.breakdown.threshold_ms;
    } else {
        data["textWeight"] = decision.breakdown.text_weight;
        data["audioWeight"] = decision.breakdown.audio_weight;
    }
    pimpl_->write(session, "decision", std::move(data));
}

void DecisionRecorder::record_interruption(SessionId session, const InterruptionEvent& event) {
    json data;
    data["type"] = interruption_type_to_string(event.type);
    data["confidence"] = event.confidence;
    data["reason"] = event.reason;
    if (event.during_chunk) {
        data["chunk"] = *event.during_chunk;
    }
    pimpl_->write(session, "interruption", std::move(data));
}

void DecisionRecorder::record_transition(SessionId session, PlaybackState from, PlaybackState to) {
    json data;
    data["from"] = playback_state_to_string(from);
    data["to"] = playback_state_to_string(to);
    pimpl_->write(session, "transition", std::move(data));
}

void DecisionRecorder::record_event(SessionId session, const std::string& event_type,
                                    const std::string& data) {
    pimpl_->write(session, event_type, json(data));
}

size_t DecisionRecorder::records_written() const {
    return pimpl_->records_written();
}

} // namespace turnkeeper
