/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace turnkeeper {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

FeatureConfig parse_feature_config(const json& j) {
    FeatureConfig config;
    if (!j.contains("features")) return config;

    const auto& f = j["features"];
    config.sample_rate = get_or_default(f, "sample_rate", config.sample_rate);
    config.tick_ms = get_or_default(f, "tick_ms", config.tick_ms);
    config.speaking_threshold = get_or_default(f, "speaking_threshold", config.speaking_threshold);
    config.playback_threshold_multiplier = get_or_default(f, "playback_threshold_multiplier",
                                                          config.playback_threshold_multiplier);
    config.pitch_window_samples = get_or_default(f, "pitch_window_samples", config.pitch_window_samples);
    return config;
}

FusionConfig parse_fusion_config(const json& j) {
    FusionConfig config;
    if (!j.contains("fusion")) return config;

    const auto& f = j["fusion"];
    config.text_weight = get_or_default(f, "text_weight", config.text_weight);
    config.threshold = get_or_default(f, "threshold", config.threshold);
    config.fallback_threshold_ms = get_or_default(f, "fallback_threshold_ms", config.fallback_threshold_ms);
    config.enable_adaptation = get_or_default(f, "enable_adaptation", config.enable_adaptation);
    config.adapt_step = get_or_default(f, "adapt_step", config.adapt_step);
    config.min_text_weight = get_or_default(f, "min_text_weight", config.min_text_weight);
    config.max_text_weight = get_or_default(f, "max_text_weight", config.max_text_weight);
    return config;
}

ContextThresholdConfig parse_context_threshold_config(const json& j) {
    ContextThresholdConfig config;
    if (!j.contains("context_threshold")) return config;

    const auto& c = j["context_threshold"];
    config.enabled = get_or_default(c, "enabled", config.enabled);
    config.min_threshold_ms = get_or_default(c, "min_threshold_ms", config.min_threshold_ms);
    config.max_threshold_ms = get_or_default(c, "max_threshold_ms", config.max_threshold_ms);
    return config;
}

InterruptionConfig parse_interruption_config(const json& j) {
    InterruptionConfig config;
    if (!j.contains("interruption")) return config;

    const auto& i = j["interruption"];
    config.enabled = get_or_default(i, "enabled", config.enabled);
    config.enable_pause_resume = get_or_default(i, "enable_pause_resume", config.enable_pause_resume);
    config.barge_in_threshold_ms = get_or_default(i, "barge_in_threshold_ms", config.barge_in_threshold_ms);
    config.backchannel_max_ms = get_or_default(i, "backchannel_max_ms", config.backchannel_max_ms);
    config.backchannel_max_intensity = get_or_default(i, "backchannel_max_intensity",
                                                      config.backchannel_max_intensity);
    config.interruption_min_intensity = get_or_default(i, "interruption_min_intensity",
                                                       config.interruption_min_intensity);
    config.nasal_min_hz = get_or_default(i, "nasal_min_hz", config.nasal_min_hz);
    config.nasal_max_hz = get_or_default(i, "nasal_max_hz", config.nasal_max_hz);
    config.impatience_count = get_or_default(i, "impatience_count", config.impatience_count);
    config.impatience_window_ms = get_or_default(i, "impatience_window_ms", config.impatience_window_ms);
    config.min_utterance_ms = get_or_default(i, "min_utterance_ms", config.min_utterance_ms);
    config.paused_min_utterance_ms = get_or_default(i, "paused_min_utterance_ms",
                                                    config.paused_min_utterance_ms);
    config.backchannel_lexicon = get_array_or_default<std::string>(i, "backchannel_lexicon",
                                                                   config.backchannel_lexicon);
    return config;
}

ChunkerConfig parse_chunker_config(const json& j) {
    ChunkerConfig config;
    if (!j.contains("chunker")) return config;

    const auto& c = j["chunker"];
    config.min_chars = get_or_default(c, "min_chars", config.min_chars);
    config.max_chars = get_or_default(c, "max_chars", config.max_chars);
    config.force_after_ms = get_or_default(c, "force_after_ms", config.force_after_ms);
    return config;
}

PlaybackConfig parse_playback_config(const json& j) {
    PlaybackConfig config;
    if (!j.contains("playback")) return config;

    const auto& p = j["playback"];
    config.full_reply_fallback = get_or_default(p, "full_reply_fallback", config.full_reply_fallback);
    config.collaborator_timeout_ms = get_or_default(p, "collaborator_timeout_ms",
                                                    config.collaborator_timeout_ms);
    return config;
}

DuckingConfig parse_ducking_config(const json& j) {
    DuckingConfig config;
    if (!j.contains("ducking")) return config;

    const auto& d = j["ducking"];
    config.enabled = get_or_default(d, "enabled", config.enabled);
    config.silence_volume = get_or_default(d, "silence_volume", config.silence_volume);
    config.backchannel_volume = get_or_default(d, "backchannel_volume", config.backchannel_volume);
    config.tentative_volume = get_or_default(d, "tentative_volume", config.tentative_volume);
    config.clear_volume = get_or_default(d, "clear_volume", config.clear_volume);
    config.step_per_tick = get_or_default(d, "step_per_tick", config.step_per_tick);
    config.clear_min_ms = get_or_default(d, "clear_min_ms", config.clear_min_ms);
    config.backchannel_max_ms = get_or_default(d, "backchannel_max_ms", config.backchannel_max_ms);
    config.backchannel_max_intensity = get_or_default(d, "backchannel_max_intensity",
                                                      config.backchannel_max_intensity);
    return config;
}

BackchannelConfig parse_backchannel_config(const json& j) {
    BackchannelConfig config;
    if (!j.contains("backchannel")) return config;

    const auto& b = j["backchannel"];
    config.enabled = get_or_default(b, "enabled", config.enabled);
    config.min_user_speech_ms = get_or_default(b, "min_user_speech_ms", config.min_user_speech_ms);
    config.min_interval_ms = get_or_default(b, "min_interval_ms", config.min_interval_ms);
    config.inhibit_ms = get_or_default(b, "inhibit_ms", config.inhibit_ms);
    config.phrases = get_array_or_default<std::string>(b, "phrases", config.phrases);
    return config;
}

RemotePredictorConfig parse_remote_config(const json& j) {
    RemotePredictorConfig config;
    if (!j.contains("remote")) return config;

    const auto& r = j["remote"];
    config.enabled = get_or_default(r, "enabled", config.enabled);
    config.endpoint = get_or_default(r, "endpoint", config.endpoint);
    config.timeout_ms = get_or_default(r, "timeout_ms", config.timeout_ms);
    config.connect_timeout_ms = get_or_default(r, "connect_timeout_ms", config.connect_timeout_ms);
    config.retry_backoff_ms = get_or_default(r, "retry_backoff_ms", config.retry_backoff_ms);
    return config;
}

BackendConfig parse_backend_config(const json& j) {
    BackendConfig config;
    if (!j.contains("backend")) return config;

    const auto& b = j["backend"];
    config.base_url = get_or_default(b, "base_url", config.base_url);
    config.timeout_ms = get_or_default(b, "timeout_ms", config.timeout_ms);
    config.partial_interval_ms = get_or_default(b, "partial_interval_ms", config.partial_interval_ms);
    config.system_prompt = get_or_default(b, "system_prompt", config.system_prompt);
    return config;
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    if (!j.contains("audio")) return config;

    const auto& a = j["audio"];
    config.input_device = get_or_default(a, "input_device", config.input_device);
    config.output_device = get_or_default(a, "output_device", config.output_device);
    config.sample_rate = get_or_default(a, "sample_rate", config.sample_rate);
    return config;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& l = j["logging"];
    config.level = get_or_default(l, "level", config.level);
    config.file = get_or_default(l, "file", config.file);
    config.record_dir = get_or_default(l, "record_dir", config.record_dir);
    return config;
}

json to_json(const EngineConfig& c) {
    json j;
    j["features"] = {
        {"sample_rate", c.features.sample_rate},
        {"tick_ms", c.features.tick_ms},
        {"speaking_threshold", c.features.speaking_threshold},
        {"playback_threshold_multiplier", c.features.playback_threshold_multiplier},
        {"pitch_window_samples", c.features.pitch_window_samples}
    };
    j["fusion"] = {
        {"text_weight", c.fusion.text_weight},
        {"threshold", c.fusion.threshold},
        {"fallback_threshold_ms", c.fusion.fallback_threshold_ms},
        {"enable_adaptation", c.fusion.enable_adaptation},
        {"adapt_step", c.fusion.adapt_step},
        {"min_text_weight", c.fusion.min_text_weight},
        {"max_text_weight", c.fusion.max_text_weight}
    };
    j["context_threshold"] = {
        {"enabled", c.context_threshold.enabled},
        {"min_threshold_ms", c.context_threshold.min_threshold_ms},
        {"max_threshold_ms", c.context_threshold.max_threshold_ms}
    };
    j["interruption"] = {
        {"enabled", c.interruption.enabled},
        {"enable_pause_resume", c.interruption.enable_pause_resume},
        {"barge_in_threshold_ms", c.interruption.barge_in_threshold_ms},
        {"backchannel_max_ms", c.interruption.backchannel_max_ms},
        {"backchannel_max_intensity", c.interruption.backchannel_max_intensity},
        {"interruption_min_intensity", c.interruption.interruption_min_intensity},
        {"nasal_min_hz", c.interruption.nasal_min_hz},
        {"nasal_max_hz", c.interruption.nasal_max_hz},
        {"impatience_count", c.interruption.impatience_count},
        {"impatience_window_ms", c.interruption.impatience_window_ms},
        {"min_utterance_ms", c.interruption.min_utterance_ms},
        {"paused_min_utterance_ms", c.interruption.paused_min_utterance_ms},
        {"backchannel_lexicon", c.interruption.backchannel_lexicon}
    };
    j["chunker"] = {
        {"min_chars", c.chunker.min_chars},
        {"max_chars", c.chunker.max_chars},
        {"force_after_ms", c.chunker.force_after_ms}
    };
    j["playback"] = {
        {"full_reply_fallback", c.playback.full_reply_fallback},
        {"collaborator_timeout_ms", c.playback.collaborator_timeout_ms}
    };
    j["ducking"] = {
        {"enabled", c.ducking.enabled},
        {"silence_volume", c.ducking.silence_volume},
        {"backchannel_volume", c.ducking.backchannel_volume},
        {"tentative_volume", c.ducking.tentative_volume},
        {"clear_volume", c.ducking.clear_volume},
        {"step_per_tick", c.ducking.step_per_tick},
        {"clear_min_ms", c.ducking.clear_min_ms},
        {"backchannel_max_ms", c.ducking.backchannel_max_ms},
        {"backchannel_max_intensity", c.ducking.backchannel_max_intensity}
    };
    j["backchannel"] = {
        {"enabled", c.backchannel.enabled},
        {"min_user_speech_ms", c.backchannel.min_user_speech_ms},
        {"min_interval_ms", c.backchannel.min_interval_ms},
        {"inhibit_ms", c.backchannel.inhibit_ms},
        {"phrases", c.backchannel.phrases}
    };
    j["remote"] = {
        {"enabled", c.remote.enabled},
        {"endpoint", c.remote.endpoint},
        {"timeout_ms", c.remote.timeout_ms},
        {"connect_timeout_ms", c.remote.connect_timeout_ms},
        {"retry_backoff_ms", c.remote.retry_backoff_ms}
    };
    j["audio"] = {
        {"input_device", c.audio.input_device},
        {"output_device", c.audio.output_device},
        {"sample_rate", c.audio.sample_rate}
    };
    j["backend"] = {
        {"base_url", c.backend.base_url},
        {"timeout_ms", c.backend.timeout_ms},
        {"partial_interval_ms", c.backend.partial_interval_ms},
        {"system_prompt", c.backend.system_prompt}
    };
    j["logging"] = {
        {"level", c.logging.level},
        {"file", c.logging.file},
        {"record_dir", c.logging.record_dir}
    };
    return j;
}

bool in_unit_range(float v) {
    return v >= 0.0f && v <= 1.0f;
}

} // anonymous namespace

// =============================================================================
// EngineConfig Implementation
// =============================================================================

Result<EngineConfig> EngineConfig::parse(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        EngineConfig config;

        config.features = parse_feature_config(j);
        config.fusion = parse_fusion_config(j);
        config.context_threshold = parse_context_threshold_config(j);
        config.interruption = parse_interruption_config(j);
        config.chunker = parse_chunker_config(j);
        config.playback = parse_playback_config(j);
        config.ducking = parse_ducking_config(j);
        config.backchannel = parse_backchannel_config(j);
        config.remote = parse_remote_config(j);
        config.audio = parse_audio_config(j);
        config.backend = parse_backend_config(j);
        config.logging = parse_logging_config(j);

        std::string validation_error = config.validate();
        if (!validation_error.empty()) {
            return make_config_error("Config validation failed: " + validation_error);
        }
        return config;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error: ") + e.what());
    }
}

Result<EngineConfig> EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_config_error("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Result<EngineConfig> result = parse(buffer.str());
    if (result.is_ok()) {
        Logger::info("Configuration loaded from: " + path);
    }
    return result;
}

std::string EngineConfig::to_json_string() const {
    return to_json(*this).dump(2);
}

Result<void> EngineConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_config_error("Failed to open file for writing: " + path);
    }
    file << to_json_string();
    Logger::info("Configuration saved to: " + path);
    return Result<void>();
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig{};  // All defaults are set in struct definitions
}

std::string EngineConfig::validate() const {
    std::ostringstream errors;

    // Features
    if (features.sample_rate <= 0) {
        errors << "features.sample_rate must be positive; ";
    }
    if (features.tick_ms <= 0) {
        errors << "features.tick_ms must be positive; ";
    }
    if (features.speaking_threshold <= 0.0f || features.speaking_threshold > 1.0f) {
        errors << "features.speaking_threshold must be in (0, 1]; ";
    }
    if (features.playback_threshold_multiplier < 1.0f) {
        errors << "features.playback_threshold_multiplier must be >= 1; ";
    }

    // Fusion
    if (fusion.min_text_weight > fusion.max_text_weight ||
        !in_unit_range(fusion.min_text_weight) || !in_unit_range(fusion.max_text_weight)) {
        errors << "fusion.min_text_weight/max_text_weight must be ordered within [0, 1]; ";
    }
    if (fusion.text_weight < fusion.min_text_weight || fusion.text_weight > fusion.max_text_weight) {
        errors << "fusion.text_weight must lie within [min_text_weight, max_text_weight]; ";
    }
    if (!in_unit_range(fusion.threshold)) {
        errors << "fusion.threshold must be in [0, 1]; ";
    }
    if (fusion.fallback_threshold_ms <= 0) {
        errors << "fusion.fallback_threshold_ms must be positive; ";
    }
    if (context_threshold.enabled &&
        (context_threshold.min_threshold_ms <= 0 ||
         context_threshold.min_threshold_ms > context_threshold.max_threshold_ms)) {
        errors << "context_threshold min/max must be positive and ordered; ";
    }

    // Interruption: pause/resume depends on classification
    if (interruption.enable_pause_resume && !interruption.enabled) {
        errors << "interruption.enable_pause_resume requires interruption.enabled; ";
    }
    if (interruption.barge_in_threshold_ms <= 0) {
        errors << "interruption.barge_in_threshold_ms must be positive; ";
    }
    if (interruption.impatience_count < 1) {
        errors << "interruption.impatience_count must be >= 1; ";
    }
    if (interruption.paused_min_utterance_ms > interruption.min_utterance_ms) {
        errors << "interruption.paused_min_utterance_ms must not exceed min_utterance_ms; ";
    }

    // Chunker
    if (chunker.min_chars <= 0 || chunker.max_chars <= chunker.min_chars) {
        errors << "chunker.max_chars must exceed chunker.min_chars (> 0); ";
    }
    if (chunker.force_after_ms <= 0) {
        errors << "chunker.force_after_ms must be positive; ";
    }

    // Ducking
    if (!in_unit_range(ducking.silence_volume) || !in_unit_range(ducking.backchannel_volume) ||
        !in_unit_range(ducking.tentative_volume) || !in_unit_range(ducking.clear_volume)) {
        errors << "ducking volumes must be in [0, 1]; ";
    }
    if (ducking.step_per_tick <= 0.0f || ducking.step_per_tick > 1.0f) {
        errors << "ducking.step_per_tick must be in (0, 1]; ";
    }

    // Backchannel
    if (backchannel.enabled && backchannel.phrases.empty()) {
        errors << "backchannel.phrases must not be empty when backchannel.enabled; ";
    }

    // Remote
    if (remote.enabled && remote.endpoint.empty()) {
        errors << "remote.endpoint is required when remote.enabled; ";
    }
    if (remote.timeout_ms <= 0 || remote.connect_timeout_ms <= 0) {
        errors << "remote timeouts must be positive; ";
    }
    if (remote.retry_backoff_ms < 0) {
        errors << "remote.retry_backoff_ms must be >= 0; ";
    }

    if (backend.timeout_ms <= 0) {
        errors << "backend.timeout_ms must be positive; ";
    }
    if (backend.partial_interval_ms < 0) {
        errors << "backend.partial_interval_ms must be >= 0; ";
    }

    return errors.str();
}

} // namespace config
} // namespace turnkeeper
