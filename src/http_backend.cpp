#include "http_backend.h"
#include "logger.h"
#include "wav.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <list>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace turnkeeper {

using json = nlohmann::json;

namespace {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

// Aborts the transfer once the request is canceled
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* canceled = static_cast<const std::atomic<bool>*>(clientp);
    return (canceled && canceled->load()) ? 1 : 0;
}

/**
 * @brief Run a prepared easy handle; cleans up the handle
 */
Result<std::string> perform(CURL* curl, const std::string& url, int timeout_ms,
                            const std::atomic<bool>* canceled) {
    std::string response_buffer;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 1000L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (canceled) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(canceled));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_timeout_error(url + " timed out after " + std::to_string(timeout_ms) + "ms");
    }
    if (res != CURLE_OK) {
        return make_error(ErrorType::CollaboratorError, url + ": " + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        return make_error(ErrorType::CollaboratorError,
                          url + " returned HTTP " + std::to_string(http_code));
    }
    return response_buffer;
}

Result<std::string> post_json(const std::string& url, const std::string& body, int timeout_ms,
                              const std::atomic<bool>* canceled) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());

    Result<std::string> result = perform(curl, url, timeout_ms, canceled);
    curl_slist_free_all(headers);
    return result;
}

Result<std::string> post_wav(const std::string& url, const std::string& wav_bytes, int timeout_ms,
                             const std::atomic<bool>* canceled) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "audio");
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");
    curl_mime_data(part, wav_bytes.data(), wav_bytes.size());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    Result<std::string> result = perform(curl, url, timeout_ms, canceled);
    curl_mime_free(mime);
    return result;
}

} // anonymous namespace

class HttpBackend::Impl : public ITranscriber, public IReplyGenerator, public ISynthesizer {
public:
    Impl(const config::BackendConfig& config, int sample_rate)
        : config_(config), sink_(nullptr), sample_rate_(sample_rate), shutting_down_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        Logger::info("Speech backend: " + config_.base_url);
    }

    ~Impl() override {
        shutting_down_ = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& entry : cancel_flags_) {
                entry.second->store(true);
            }
        }
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) worker.thread.join();
        }
        curl_global_cleanup();
    }

    // =========================================================================
    // ITranscriber
    // =========================================================================

    void start(const RequestTicket& ticket) override {
        std::lock_guard<std::mutex> lock(mutex_);
        Transcription t;
        t.ticket = ticket;
        t.partial_in_flight = std::make_shared<std::atomic<bool>>(false);
        transcriptions_[ticket.id] = t;
        cancel_flags_[ticket.id] = std::make_shared<std::atomic<bool>>(false);
    }

    void feed(RequestId id, const AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transcriptions_.find(id);
        if (it == transcriptions_.end()) return;

        Transcription& t = it->second;
        t.audio.insert(t.audio.end(), frame.begin(), frame.end());

        if (config_.partial_interval_ms <= 0 || t.partial_in_flight->load()) return;
        size_t interval = ms_to_samples(config_.partial_interval_ms, sample_rate_);
        if (t.audio.size() - t.last_partial_samples < interval) return;

        t.last_partial_samples = t.audio.size();
        t.partial_in_flight->store(true);
        launch([this, ticket = t.ticket, audio = t.audio, flag = cancel_flags_[id],
                in_flight = t.partial_in_flight]() {
            Result<std::string> text = transcribe(audio, flag.get());
            in_flight->store(false);
            if (flag->load() || !text.is_ok()) return;  // partials are best effort
            post_transcript(ticket, text.value(), false);
        });
    }

    void finalize(RequestId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transcriptions_.find(id);
        if (it == transcriptions_.end()) return;

        RequestTicket ticket = it->second.ticket;
        AudioBuffer audio = std::move(it->second.audio);
        transcriptions_.erase(it);

        launch([this, ticket, audio = std::move(audio), flag = cancel_flags_[id]]() {
            Result<std::string> text = transcribe(audio, flag.get());
            if (flag->load()) return;
            forget(ticket.id);
            if (!text.is_ok()) {
                post_failure(ticket, text.error());
                return;
            }
            post_transcript(ticket, text.value(), true);
        });
    }

    // =========================================================================
    // IReplyGenerator
    // =========================================================================

    void generate(const RequestTicket& ticket, const std::string& user_text,
                  const ReplyHints& hints) override {
        json messages = json::array();
        if (!config_.system_prompt.empty()) {
            messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& turn : history_) {
                messages.push_back({{"role", turn.first}, {"content", turn.second}});
            }
            cancel_flags_[ticket.id] = std::make_shared<std::atomic<bool>>(false);
        }
        if (hints.prefer_concise) {
            messages.push_back({{"role", "system"},
                                {"content", "The user is impatient. Answer in one short sentence."}});
        }
        messages.push_back({{"role", "user"}, {"content", user_text}});
        json body = {{"messages", messages}};

        CancelFlag flag = flag_for(ticket.id);
        launch([this, ticket, user_text, body = body.dump(), flag]() {
            Result<std::string> response = post_json(config_.base_url + "/api/chat", body,
                                                     config_.timeout_ms, flag.get());
            if (flag->load()) return;
            forget(ticket.id);
            if (!response.is_ok()) {
                post_failure(ticket, response.error());
                return;
            }

            std::string content;
            try {
                json j = json::parse(response.value());
                content = j.at("message").at("content").get<std::string>();
            } catch (const json::exception& e) {
                post_failure(ticket, make_parse_error(std::string("chat response: ") + e.what()));
                return;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                history_.emplace_back("user", user_text);
                history_.emplace_back("assistant", content);
            }

            ReplyDelta delta;
            delta.request = ticket.id;
            delta.session = ticket.session;
            delta.text = content;
            delta.done = true;
            post(delta);
        });
    }

    // =========================================================================
    // ISynthesizer
    // =========================================================================

    void synthesize(const RequestTicket& ticket, const SpeechChunk& chunk) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancel_flags_[ticket.id] = std::make_shared<std::atomic<bool>>(false);
        }
        CancelFlag flag = flag_for(ticket.id);
        launch([this, ticket, text = chunk.text, index = chunk.index, flag]() {
            Result<AudioBuffer> audio = tts(text, flag.get());
            if (flag->load()) return;
            forget(ticket.id);
            if (!audio.is_ok()) {
                post_failure(ticket, audio.error());
                return;
            }
            SynthesisReady ready;
            ready.request = ticket.id;
            ready.session = ticket.session;
            ready.chunk_index = index;
            ready.audio = std::make_shared<const AudioBuffer>(std::move(audio.value()));
            post(ready);
        });
    }

    // Shared by all three interfaces; request ids are unique across kinds
    void cancel(RequestId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cancel_flags_.find(id);
        if (it != cancel_flags_.end()) {
            it->second->store(true);
            cancel_flags_.erase(it);
        }
        transcriptions_.erase(id);
    }

    void set_event_sink(IEventSink* sink) {
        sink_ = sink;
    }

    Result<AudioBuffer> synthesize_now(const std::string& text) {
        return tts(text, nullptr);
    }

    bool health_check() {
        CURL* curl = curl_easy_init();
        if (!curl) return false;
        Result<std::string> result = perform(curl, config_.base_url + "/health", 2000, nullptr);
        return result.is_ok();
    }

private:
    struct Transcription {
        RequestTicket ticket;
        AudioBuffer audio;
        size_t last_partial_samples = 0;
        std::shared_ptr<std::atomic<bool>> partial_in_flight;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    template <typename Fn>
    void launch(Fn fn) {
        if (shutting_down_) return;
        std::lock_guard<std::mutex> lock(workers_mutex_);
        // Reap finished workers
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        worker.thread = std::thread([fn = std::move(fn), done = worker.done]() mutable {
            fn();
            done->store(true);
        });
        workers_.push_back(std::move(worker));
    }

    CancelFlag flag_for(RequestId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cancel_flags_.find(id);
        if (it != cancel_flags_.end()) return it->second;
        return std::make_shared<std::atomic<bool>>(false);
    }

    void forget(RequestId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_flags_.erase(id);
    }

    Result<std::string> transcribe(const AudioBuffer& audio, const std::atomic<bool>* canceled) {
        Result<std::string> response = post_wav(config_.base_url + "/api/stt",
                                                wav::encode(audio, sample_rate_),
                                                config_.timeout_ms, canceled);
        if (!response.is_ok()) return response.error();
        try {
            json j = json::parse(response.value());
            return j.value("transcript", std::string());
        } catch (const json::exception& e) {
            return make_parse_error(std::string("stt response: ") + e.what());
        }
    }

    Result<AudioBuffer> tts(const std::string& text, const std::atomic<bool>* canceled) {
        json body = {{"text", text}};
        Result<std::string> response = post_json(config_.base_url + "/api/tts", body.dump(),
                                                 config_.timeout_ms, canceled);
        if (!response.is_ok()) return response.error();

        std::string encoded;
        try {
            json j = json::parse(response.value());
            encoded = j.at("audio").get<std::string>();
        } catch (const json::exception& e) {
            return make_parse_error(std::string("tts response: ") + e.what());
        }
        Result<std::string> bytes = wav::base64_decode(encoded);
        if (!bytes.is_ok()) return bytes.error();
        return wav::decode(bytes.value(), sample_rate_);
    }

    void post(CollaboratorEvent event) {
        IEventSink* sink = sink_.load();
        if (sink) {
            sink->post(std::move(event));
        }
    }

    void post_transcript(const RequestTicket& ticket, const std::string& text, bool is_final) {
        TranscriptUpdate update;
        update.request = ticket.id;
        update.session = ticket.session;
        update.utterance.text = text;
        update.utterance.is_final = is_final;
        update.utterance.started_at = ticket.issued_at;
        post(update);
    }

    void post_failure(const RequestTicket& ticket, const Error& error) {
        Logger::warn(std::string("[Backend] ") + request_kind_to_string(ticket.kind) +
                     " request " + std::to_string(ticket.id) + " failed: " + error.to_string());
        CollaboratorFailure failure;
        failure.request = ticket.id;
        failure.session = ticket.session;
        failure.kind = ticket.kind;
        failure.error = error.type == ErrorType::CollaboratorTimeout
                        ? error
                        : make_error(ErrorType::CollaboratorError, error.message);
        post(failure);
    }

    config::BackendConfig config_;
    std::atomic<IEventSink*> sink_;
    int sample_rate_;
    std::atomic<bool> shutting_down_;

    std::mutex mutex_;
    std::map<RequestId, CancelFlag> cancel_flags_;
    std::map<RequestId, Transcription> transcriptions_;
    std::vector<std::pair<std::string, std::string>> history_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

HttpBackend::HttpBackend(const config::BackendConfig& config, int sample_rate)
    : pimpl_(std::make_unique<Impl>(config, sample_rate)) {}

void HttpBackend::set_event_sink(IEventSink* sink) {
    pimpl_->set_event_sink(sink);
}

HttpBackend::~HttpBackend() = default;

ITranscriber& HttpBackend::transcriber() {
    return *pimpl_;
}

IReplyGenerator& HttpBackend::reply_generator() {
    return *pimpl_;
}

ISynthesizer& HttpBackend::synthesizer() {
    return *pimpl_;
}

Result<AudioBuffer> HttpBackend::synthesize_now(const std::string& text) {
    return pimpl_->synthesize_now(text);
}

bool HttpBackend::health_check() {
    return pimpl_->health_check();
}

} // namespace turnkeeper
