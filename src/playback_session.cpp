#include "playback_session.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

namespace turnkeeper {

PlaybackSession::PlaybackSession(SessionId id,
                                 const config::PlaybackConfig& playback_config,
                                 const config::ChunkerConfig& chunker_config,
                                 TicketRegistry& tickets,
                                 SessionCollaborators collaborators,
                                 TimePoint now)
    : id_(id)
    , config_(playback_config)
    , tickets_(tickets)
    , collaborators_(collaborators)
    , chunker_(chunker_config, now) {
    // Every session starts at full volume
    set_volume(1.0f);
    LOG_TRACE(id_, "session_created", "");
}

PlaybackSession::~PlaybackSession() {
    if (!is_finished()) {
        abort("session destroyed");
    }
}

bool PlaybackSession::is_audible() const {
    return state() == PlaybackState::Playing && playing_.has_value() && !device_paused_;
}

std::string PlaybackSession::remaining_text() const {
    std::ostringstream oss;
    if (full_reply_) {
        return full_reply_->text;
    }
    bool first = true;
    for (const auto& entry : chunks_) {
        if (!first) oss << ' ';
        oss << entry.second.chunk.text;
        first = false;
    }
    std::string pending = utils::trim_copy(chunker_.pending());
    if (!pending.empty()) {
        if (!first) oss << ' ';
        oss << pending;
    }
    return oss.str();
}

bool PlaybackSession::verify_owned(const RequestTicket& ticket) const {
    if (ticket.session == id_) {
        return true;
    }
    Logger::warn("[Queue] Ticket " + std::to_string(ticket.id) + " belongs to session " +
                 std::to_string(ticket.session) + ", not " + std::to_string(id_));
    return false;
}

void PlaybackSession::set_volume(float volume) {
    volume_ = volume;
    if (collaborators_.device) {
        collaborators_.device->set_volume(volume);
    }
}

// =============================================================================
// Reply text -> chunks -> synthesis
// =============================================================================

void PlaybackSession::on_reply_delta(const ReplyDelta& delta, TimePoint now) {
    if (is_finished()) return;

    reply_text_ += delta.text;
    std::vector<SpeechChunk> ready = chunker_.add(delta.text, now);

    if (delta.done) {
        tickets_.retire(delta.request);
        reply_done_ = true;
        std::vector<SpeechChunk> rest = chunker_.flush();
        ready.insert(ready.end(), rest.begin(), rest.end());
        if (chunker_.next_index() > 0) {
            final_index_ = chunker_.next_index() - 1;
        }
    }

    for (auto& chunk : ready) {
        if (final_index_ && chunk.index == *final_index_) {
            chunk.is_final = true;
        }
        dispatch(chunk);
    }

    if (delta.done) {
        if (!final_index_) {
            LOG_QUEUE("Empty reply, nothing to play");
            complete();
            return;
        }
        // Final marker may land after the last chunk was already dispatched
        auto it = chunks_.find(*final_index_);
        if (it != chunks_.end()) {
            it->second.chunk.is_final = true;
        }
        if (config_.full_reply_fallback && chunks_played_ == 0 && !playing_) {
            request_full_reply();
        }
        // The final chunk may already have finished playing
        if (!playing_ && next_to_play_ > *final_index_) {
            complete();
        }
    }
}

void PlaybackSession::dispatch(const SpeechChunk& chunk) {
    Slot slot;
    slot.chunk = chunk;
    if (collaborators_.synthesizer) {
        RequestTicket ticket = tickets_.issue(id_, RequestKind::Synthesis, chunk.index);
        slot.request = ticket.id;
        chunks_[chunk.index] = slot;
        collaborators_.synthesizer->synthesize(ticket, chunk);
    } else {
        chunks_[chunk.index] = slot;
    }
}

void PlaybackSession::request_full_reply() {
    if (!collaborators_.synthesizer || reply_text_.empty()) return;

    SpeechChunk full;
    full.index = FULL_REPLY_INDEX;
    full.text = utils::trim_copy(reply_text_);
    full.is_final = true;

    RequestTicket ticket = tickets_.issue(id_, RequestKind::FullReplySynthesis, FULL_REPLY_INDEX);
    full_request_ = ticket.id;
    LOG_QUEUE("Requesting full-reply synthesis as fallback");
    collaborators_.synthesizer->synthesize(ticket, full);
}

void PlaybackSession::on_synthesis_ready(const SynthesisReady& ready) {
    std::optional<RequestTicket> ticket = tickets_.find(ready.request, id_);
    if (!ticket || is_finished()) {
        LOG_DEBUG("Discarding late synthesis result " + std::to_string(ready.request));
        return;
    }
    tickets_.retire(ready.request);

    if (ticket->kind == RequestKind::FullReplySynthesis) {
        full_request_.reset();
        if (chunks_played_ > 0 || playing_) {
            LOG_DEBUG("Full reply arrived after chunked playback started, discarding");
            return;
        }
        LOG_QUEUE("Full reply ready before any chunk, playing it alone");
        cancel_chunk_requests();
        chunks_.clear();

        SpeechChunk full;
        full.index = FULL_REPLY_INDEX;
        full.text = utils::trim_copy(reply_text_);
        full.audio = ready.audio;
        full.is_final = true;
        full_reply_ = full;
        if (state() != PlaybackState::Paused) {
            start_on_device(full);
        }
        return;
    }

    auto it = chunks_.find(ready.chunk_index);
    if (it == chunks_.end()) {
        LOG_DEBUG("No slot for chunk " + std::to_string(ready.chunk_index));
        return;
    }
    it->second.chunk.audio = ready.audio;
    it->second.request.reset();
    try_play_next();
}

// =============================================================================
// Ordered playback
// =============================================================================

void PlaybackSession::try_play_next() {
    if (state() != PlaybackState::Idle && state() != PlaybackState::Playing) return;
    if (playing_ || full_reply_) return;

    auto it = chunks_.find(next_to_play_);
    if (it == chunks_.end() || !it->second.chunk.audio) return;

    if (full_request_) {
        // Chunked playback wins; the full reply must never play on top of it
        std::optional<RequestTicket> full = tickets_.find(*full_request_, id_);
        if (full) {
            tickets_.retire(full->id);
            cancel_ticket(*full);
        }
        full_request_.reset();
        LOG_QUEUE("Chunked playback started, full-reply synthesis suppressed");
    }

    start_on_device(it->second.chunk);
}

void PlaybackSession::start_on_device(const SpeechChunk& chunk) {
    playing_ = chunk.index;
    if (collaborators_.device) {
        collaborators_.device->play(id_, chunk);
    }
    state_machine_.apply(PlaybackEvent::ChunkStarted);
    LOG_TRACE(id_, "chunk_started", "index=" + std::to_string(chunk.index));
}

void PlaybackSession::on_playback_finished(const PlaybackFinished& finished) {
    if (finished.session != id_ || !playing_ || finished.chunk_index != *playing_) {
        LOG_DEBUG("Ignoring stale playback completion for chunk " +
                  std::to_string(finished.chunk_index));
        return;
    }
    if (is_finished()) return;

    playing_.reset();
    chunks_played_++;

    if (full_reply_) {
        complete();
        return;
    }

    chunks_.erase(finished.chunk_index);
    next_to_play_ = finished.chunk_index + 1;

    if (final_index_ && finished.chunk_index >= *final_index_) {
        complete();
        return;
    }
    try_play_next();
}

void PlaybackSession::complete() {
    if (!state_machine_.apply(PlaybackEvent::FinalChunkDone)) return;

    // Reply may still hold a transcription ticket from the turn that produced it
    for (const auto& ticket : tickets_.retire_session(id_)) {
        cancel_ticket(ticket);
    }
    LOG_QUEUE("Session " + std::to_string(id_) + " completed after " +
              std::to_string(chunks_played_) + " chunk(s)");
}

// =============================================================================
// Pause / resume / abort
// =============================================================================

Result<void> PlaybackSession::pause() {
    if (!state_machine_.can_apply(PlaybackEvent::Pause)) {
        return make_error(ErrorType::Unknown, std::string("cannot pause in state ") +
                          playback_state_to_string(state()));
    }
    state_machine_.apply(PlaybackEvent::Pause);

    paused_index_ = playing_ ? *playing_ : next_to_play_;
    if (playing_ && collaborators_.device) {
        collaborators_.device->pause();
        device_paused_ = true;
    }
    LOG_QUEUE("Paused at chunk " + std::to_string(*paused_index_));
    return Result<void>();
}

Result<void> PlaybackSession::resume() {
    if (!state_machine_.can_apply(PlaybackEvent::Resume)) {
        return make_error(ErrorType::Unknown, std::string("cannot resume in state ") +
                          playback_state_to_string(state()));
    }
    state_machine_.apply(PlaybackEvent::Resume);

    LOG_QUEUE("Resuming at chunk " + std::to_string(paused_index_.value_or(next_to_play_)));
    paused_index_.reset();
    if (device_paused_) {
        device_paused_ = false;
        if (collaborators_.device) {
            collaborators_.device->resume();
        }
    } else if (full_reply_ && !playing_) {
        start_on_device(*full_reply_);
    } else {
        try_play_next();
    }
    return Result<void>();
}

void PlaybackSession::abort(const std::string& reason) {
    if (!state_machine_.apply(PlaybackEvent::Abort)) return;

    std::vector<RequestTicket> retired = tickets_.retire_session(id_);
    for (const auto& ticket : retired) {
        cancel_ticket(ticket);
    }
    if (collaborators_.device) {
        collaborators_.device->stop();
    }

    playing_.reset();
    device_paused_ = false;
    chunks_.clear();
    full_request_.reset();
    full_reply_.reset();

    std::ostringstream oss;
    oss << "Session " << id_ << " aborted (" << reason << "), canceled "
        << retired.size() << " request(s)";
    LOG_QUEUE(oss.str());
}

bool PlaybackSession::on_failure(const CollaboratorFailure& failure) {
    std::optional<RequestTicket> ticket = tickets_.find(failure.request, id_);
    if (!ticket || is_finished()) {
        LOG_DEBUG("Discarding late failure for request " + std::to_string(failure.request));
        return false;
    }
    tickets_.retire(failure.request);
    if (failure.error.type == ErrorType::CollaboratorTimeout) {
        // Still running on the collaborator side
        cancel_ticket(*ticket);
    }

    if (failure.kind == RequestKind::FullReplySynthesis) {
        // Fallback only; chunked synthesis carries on
        full_request_.reset();
        Logger::warn("[Queue] Full-reply synthesis failed: " + failure.error.to_string());
        return false;
    }

    Logger::warn("[Queue] " + std::string(request_kind_to_string(failure.kind)) +
                 " failed: " + failure.error.to_string());
    abort(failure.error.to_string());
    return true;
}

void PlaybackSession::cancel_ticket(const RequestTicket& ticket) {
    switch (ticket.kind) {
        case RequestKind::Synthesis:
        case RequestKind::FullReplySynthesis:
            if (collaborators_.synthesizer) collaborators_.synthesizer->cancel(ticket.id);
            break;
        case RequestKind::Reply:
            if (collaborators_.reply_generator) collaborators_.reply_generator->cancel(ticket.id);
            break;
        case RequestKind::Transcription:
            if (collaborators_.transcriber) collaborators_.transcriber->cancel(ticket.id);
            break;
    }
}

void PlaybackSession::cancel_chunk_requests() {
    for (auto& entry : chunks_) {
        if (!entry.second.request) continue;
        std::optional<RequestTicket> ticket = tickets_.find(*entry.second.request, id_);
        if (ticket) {
            tickets_.retire(ticket->id);
            cancel_ticket(*ticket);
        }
        entry.second.request.reset();
    }
}

} // namespace turnkeeper
