#include "remote_turn_predictor.h"
#include "prediction_contract.h"
#include "logger.h"
#include <atomic>
#include <curl/curl.h>
#include <list>
#include <mutex>
#include <thread>

namespace turnkeeper {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

} // anonymous namespace

class RemoteTurnPredictor::Impl {
public:
    explicit Impl(const config::RemotePredictorConfig& config)
        : config_(config), shutting_down_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        LOG_REMOTE("Turn prediction endpoint: " + config_.endpoint);
    }

    ~Impl() {
        shutting_down_ = true;
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

    void launch(RequestId id, const DecisionInput& input, IEventSink& sink) {
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
        worker.thread = std::thread([this, id, input, &sink, done = worker.done]() {
            Result<TurnDecision> result = request(input);
            TurnPrediction prediction;
            prediction.request = id;
            if (result.is_ok()) {
                prediction.decision = result.value();
            } else {
                prediction.error = result.error();
            }
            if (!shutting_down_) {
                sink.post(std::move(prediction));
            }
            done->store(true);
        });
        workers_.push_back(std::move(worker));
    }

    Result<TurnDecision> request(const DecisionInput& input) {
        std::string request_json = contract::encode_request(input);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("turn-prediction timed out after " +
                                      std::to_string(config_.timeout_ms) + "ms");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_code != 200) {
            return make_network_error("turn-prediction HTTP " + std::to_string(http_code));
        }

        return contract::decode_decision(response_buffer);
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    config::RemotePredictorConfig config_;
    std::atomic<bool> shutting_down_;
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

RemoteTurnPredictor::RemoteTurnPredictor(const config::RemotePredictorConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RemoteTurnPredictor::~RemoteTurnPredictor() = default;

void RemoteTurnPredictor::launch(RequestId id, const DecisionInput& input, IEventSink& sink) {
    impl_->launch(id, input, sink);
}

Result<TurnDecision> RemoteTurnPredictor::request(const DecisionInput& input) {
    return impl_->request(input);
}

} // namespace turnkeeper
