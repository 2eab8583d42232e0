#pragma once

/**
 * @file playback_session.h
 * @brief One assistant reply from streamed text to audible chunks
 *
 * Reply text is chunked as it arrives, every chunk is sent to synthesis at
 * once, and ready chunks are played strictly in index order, one at a time.
 * Aborting cancels every request the session still has in flight before it
 * returns. Results for retired requests are discarded.
 */

#include "cancellation.h"
#include "collaborators.h"
#include "core/config.h"
#include "speech_chunker.h"
#include "state_machine.h"
#include <map>
#include <optional>
#include <string>

namespace turnkeeper {

/**
 * @brief Collaborators a session cancels into; null members are skipped
 */
struct SessionCollaborators {
    ISynthesizer* synthesizer = nullptr;
    IPlaybackDevice* device = nullptr;
    IReplyGenerator* reply_generator = nullptr;
    ITranscriber* transcriber = nullptr;
};

class PlaybackSession {
public:
    /// Chunk index used for the single-request full reply
    static constexpr uint32_t FULL_REPLY_INDEX = 0xFFFFFFFFu;

    PlaybackSession(SessionId id,
                    const config::PlaybackConfig& playback_config,
                    const config::ChunkerConfig& chunker_config,
                    TicketRegistry& tickets,
                    SessionCollaborators collaborators,
                    TimePoint now = Clock::now());
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    SessionId id() const { return id_; }
    PlaybackState state() const { return state_machine_.get_state(); }
    bool is_finished() const { return is_terminal(state()); }

    /**
     * @brief A chunk is on the device and not paused
     */
    bool is_audible() const;

    /// Chunk on the device (paused or not)
    std::optional<uint32_t> current_chunk() const { return playing_; }

    /// Chunk index captured by the last pause
    std::optional<uint32_t> paused_at() const { return paused_index_; }

    /// Text not yet heard: current chunk, queued chunks and unchunked text
    std::string remaining_text() const;

    /// Everything the reply generator produced so far
    const std::string& reply_text() const { return reply_text_; }

    uint32_t chunks_played() const { return chunks_played_; }
    size_t pending_chunks() const { return chunks_.size(); }

    /**
     * @brief Does the ticket belong to this session? Warns when it does not
     *
     * Cancellation itself goes through TicketRegistry::retire_session.
     */
    bool verify_owned(const RequestTicket& ticket) const;

    // Collaborator results (already routed to this session by id)
    void on_reply_delta(const ReplyDelta& delta, TimePoint now = Clock::now());
    void on_synthesis_ready(const SynthesisReady& ready);
    void on_playback_finished(const PlaybackFinished& finished);

    /**
     * @brief A request of this session failed or timed out
     * @return True if the failure ended the session
     */
    bool on_failure(const CollaboratorFailure& failure);

    /**
     * @brief PLAYING -> PAUSED, keeping every request alive
     */
    Result<void> pause();

    /**
     * @brief PAUSED -> PLAYING at the captured chunk
     */
    Result<void> resume();

    /**
     * @brief Cancel everything in flight and silence the device (idempotent)
     */
    void abort(const std::string& reason);

    float volume() const { return volume_; }
    void set_volume(float volume);

private:
    struct Slot {
        SpeechChunk chunk;
        std::optional<RequestId> request;
    };

    void dispatch(const SpeechChunk& chunk);
    void request_full_reply();
    void cancel_ticket(const RequestTicket& ticket);
    void cancel_chunk_requests();
    void try_play_next();
    void start_on_device(const SpeechChunk& chunk);
    void complete();

    SessionId id_;
    config::PlaybackConfig config_;
    TicketRegistry& tickets_;
    SessionCollaborators collaborators_;
    PlaybackStateMachine state_machine_;
    SpeechChunker chunker_;

    std::map<uint32_t, Slot> chunks_;       ///< Not yet finished, keyed by index
    uint32_t next_to_play_ = 0;
    std::optional<uint32_t> playing_;
    std::optional<uint32_t> final_index_;
    std::optional<uint32_t> paused_index_;
    bool device_paused_ = false;
    bool reply_done_ = false;
    uint32_t chunks_played_ = 0;

    std::string reply_text_;
    std::optional<RequestId> full_request_;
    std::optional<SpeechChunk> full_reply_;  ///< Playing alone instead of the chunks

    float volume_ = 1.0f;
};

} // namespace turnkeeper
