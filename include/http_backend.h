#pragma once

/**
 * @file http_backend.h
 * @brief Transcription, reply and synthesis collaborators over HTTP
 *
 * Talks to the speech/chat backend:
 * - POST /api/stt   multipart "audio" WAV      -> {"transcript": "..."}
 * - POST /api/chat  {"messages": [...]}        -> {"message": {"content": "..."}}
 * - POST /api/tts   {"text": "..."}            -> {"audio": "data:audio/wav;base64,..."}
 *
 * Every request runs on its own worker thread and reports back through the
 * event sink. cancel() aborts the transfer; a canceled request posts nothing.
 */

#include "collaborators.h"
#include "core/config.h"
#include "errors.h"
#include <memory>
#include <string>

namespace turnkeeper {

class HttpBackend {
public:
    /**
     * @param sample_rate Rate of captured audio and of returned synthesis
     */
    explicit HttpBackend(const config::BackendConfig& config,
                         int sample_rate = DEFAULT_SAMPLE_RATE);

    /**
     * @brief Cancels every request and joins the workers
     */
    ~HttpBackend();

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    /**
     * @brief Where results are posted; must outlive the backend
     */
    void set_event_sink(IEventSink* sink);

    ITranscriber& transcriber();
    IReplyGenerator& reply_generator();
    ISynthesizer& synthesizer();

    /**
     * @brief Blocking synthesis, for short cues prepared at startup
     */
    Result<AudioBuffer> synthesize_now(const std::string& text);

    /**
     * @brief GET /health
     */
    bool health_check();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace turnkeeper
