#include "audio_io.h"
#include "core/config.h"
#include "decision_recorder.h"
#include "fusion_engine.h"
#include "http_backend.h"
#include "logger.h"
#include "prediction_contract.h"
#include "turn_engine.h"
#include <csignal>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace turnkeeper {

static TurnEngine* g_engine = nullptr;

void signal_handler(int) {
    if (g_engine) {
        g_engine->shutdown();
    }
}

/**
 * @brief Default config: ../config/config.json next to the executable, else ./config/config.json
 */
std::string default_config_path() {
    std::string config_path = "config/config.json";
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

Result<EngineConfig> load_config(const std::string& path) {
    std::ifstream test(path);
    if (!test.good()) {
        Logger::warn("No config at " + path + ", using defaults");
        return EngineConfig::defaults();
    }
    return EngineConfig::load(path);
}

/**
 * @brief One offline decision with neutral prosody, printed as the endpoint's JSON
 */
int decide_once(const std::string& transcript, const std::string& silence_arg,
                const EngineConfig& config) {
    int64_t silence_ms = 0;
    try {
        silence_ms = std::stoll(silence_arg);
    } catch (const std::exception&) {
        Logger::error("Invalid silence duration: " + silence_arg);
        return 2;
    }

    AudioFeatures features;
    features.silence_duration_ms = silence_ms;
    features.intensity_rms = 0.05f;
    features.pitch_trend = 0.0f;
    features.speaking_rate_hz = 3.0f;
    features.is_speaking = false;

    DecisionInput input;
    input.transcript = transcript;
    input.features = features;
    input.silence_duration_ms = silence_ms;
    input.fallback_threshold_ms = config.fusion.fallback_threshold_ms;

    FusionEngine fusion(config.fusion);
    TurnDecision decision = fusion.decide(input);
    std::cout << contract::encode_decision(decision) << std::endl;
    return 0;
}

int run_live(const EngineConfig& config) {
    AudioIO audio;
    Result<void> started = audio.start(config.audio.input_device, config.audio.output_device,
                                       config.audio.sample_rate);
    if (!started) {
        Logger::error(started.error().to_string());
        return 1;
    }

    HttpBackend backend(config.backend, config.audio.sample_rate);
    if (!backend.health_check()) {
        Logger::warn("Speech backend at " + config.backend.base_url + " is not answering");
    } else if (config.backchannel.enabled) {
        for (const auto& phrase : config.backchannel.phrases) {
            Result<AudioBuffer> cue = backend.synthesize_now(phrase);
            if (cue) {
                audio.register_cue(phrase, cue.value());
            } else {
                Logger::warn("Cue \"" + phrase + "\" unavailable: " + cue.error().to_string());
            }
        }
    }

    EngineCollaborators collaborators;
    collaborators.transcriber = &backend.transcriber();
    collaborators.reply_generator = &backend.reply_generator();
    collaborators.synthesizer = &backend.synthesizer();
    collaborators.device = &audio;

    EngineConfig engine_config = config;
    engine_config.features.sample_rate = config.audio.sample_rate;
    TurnEngine engine(engine_config, collaborators);
    backend.set_event_sink(&engine.events());
    audio.set_event_sink(&engine.events());

    std::unique_ptr<DecisionRecorder> recorder;
    if (!config.logging.record_dir.empty()) {
        recorder = std::make_unique<DecisionRecorder>(config.logging.record_dir);
        Result<void> recording = recorder->start();
        if (recording) {
            engine.set_recorder(recorder.get());
        } else {
            Logger::warn(recording.error().to_string());
        }
    }

    g_engine = &engine;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int result = engine.run(audio);

    g_engine = nullptr;
    Logger::info("Shutting down...");
    audio.set_event_sink(nullptr);
    backend.set_event_sink(nullptr);
    audio.close();
    if (recorder) {
        recorder->finish();
    }
    return result;
}

} // namespace turnkeeper

int main(int argc, char* argv[]) {
    turnkeeper::Logger::initialize(turnkeeper::LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        turnkeeper::AudioIO::list_devices();
        turnkeeper::Logger::shutdown();
        return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--decide") {
        if (argc < 4) {
            std::cerr << "usage: turnkeeper --decide \"<transcript>\" <silence_ms> [config.json]"
                      << std::endl;
            return 2;
        }
        std::string path = argc > 4 ? argv[4] : turnkeeper::default_config_path();
        turnkeeper::Logger::set_level(turnkeeper::LogLevel::WARN);
        auto config = turnkeeper::load_config(path);
        if (!config) {
            turnkeeper::Logger::error(config.error().to_string());
            return 1;
        }
        int result = turnkeeper::decide_once(argv[2], argv[3], config.value());
        turnkeeper::Logger::shutdown();
        return result;
    }

    std::string config_path = argc > 1 ? argv[1] : turnkeeper::default_config_path();
    auto config = turnkeeper::load_config(config_path);
    if (!config) {
        turnkeeper::Logger::error(config.error().to_string());
        turnkeeper::Logger::shutdown();
        return 1;
    }

    turnkeeper::Logger::shutdown();
    turnkeeper::Logger::initialize(turnkeeper::log_level_from_string(config.value().logging.level),
                                   config.value().logging.file);

    int result = turnkeeper::run_live(config.value());

    turnkeeper::Logger::shutdown();
    return result;
}
