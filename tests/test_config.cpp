/**
 * Tests for configuration parsing, validation and serialization.
 * Asserts:
 * - Defaults are valid and match the tuned constants.
 * - Missing sections and keys keep their defaults; present keys override.
 * - Invalid values are rejected as InvalidConfig, malformed JSON as ParseError.
 *
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include "logger.h"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

using namespace turnkeeper;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool rejected(const std::string& json_text, ErrorType expected) {
    Result<EngineConfig> result = EngineConfig::parse(json_text);
    return !result && result.error().type == expected;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Defaults ---
    EngineConfig defaults = EngineConfig::defaults();
    ASSERT(defaults.validate().empty());
    ASSERT(defaults.features.tick_ms == 50);
    ASSERT(defaults.fusion.text_weight == 0.6f);
    ASSERT(defaults.fusion.threshold == 0.7f);
    ASSERT(defaults.fusion.fallback_threshold_ms == 800);
    ASSERT(defaults.interruption.barge_in_threshold_ms == 300);
    ASSERT(defaults.interruption.enabled && defaults.interruption.enable_pause_resume);
    ASSERT(defaults.chunker.min_chars == 60 && defaults.chunker.max_chars == 220);
    ASSERT(defaults.playback.collaborator_timeout_ms == 8000);
    ASSERT(!defaults.backchannel.enabled);
    ASSERT(!defaults.remote.enabled);
    ASSERT(defaults.remote.retry_backoff_ms == 2000);

    // --- Empty document is all defaults ---
    {
        Result<EngineConfig> result = EngineConfig::parse("{}");
        ASSERT(result.is_ok());
        ASSERT(result.value().to_json_string() == defaults.to_json_string());
    }

    // --- Overrides ---
    {
        const char* text = R"({
            "fusion": {"text_weight": 0.5, "enable_adaptation": true},
            "interruption": {"barge_in_threshold_ms": 400, "backchannel_lexicon": ["mm", "yeah"]},
            "chunker": {"min_chars": 40},
            "backchannel": {"enabled": true, "phrases": ["uh-huh"]},
            "remote": {"enabled": true, "endpoint": "http://predictor:9000/api/turn-prediction"},
            "backend": {"base_url": "http://backend:3001", "partial_interval_ms": 0},
            "logging": {"level": "debug", "record_dir": "/tmp/records"}
        })";
        Result<EngineConfig> result = EngineConfig::parse(text);
        ASSERT(result.is_ok());
        const EngineConfig& c = result.value();
        ASSERT(c.fusion.text_weight == 0.5f);
        ASSERT(c.fusion.enable_adaptation);
        ASSERT(c.fusion.threshold == 0.7f);
        ASSERT(c.interruption.barge_in_threshold_ms == 400);
        ASSERT(c.interruption.backchannel_lexicon.size() == 2);
        ASSERT(c.interruption.min_utterance_ms == 900);
        ASSERT(c.chunker.min_chars == 40 && c.chunker.max_chars == 220);
        ASSERT(c.backchannel.enabled && c.backchannel.phrases.size() == 1);
        ASSERT(c.remote.enabled && c.remote.endpoint == "http://predictor:9000/api/turn-prediction");
        ASSERT(c.backend.base_url == "http://backend:3001");
        ASSERT(c.backend.partial_interval_ms == 0);
        ASSERT(c.backend.timeout_ms == 60000);
        ASSERT(c.logging.level == "debug" && c.logging.record_dir == "/tmp/records");

        // Serialized form parses back to the same config
        Result<EngineConfig> again = EngineConfig::parse(c.to_json_string());
        ASSERT(again.is_ok());
        ASSERT(again.value().to_json_string() == c.to_json_string());
    }

    // --- Validation ---
    ASSERT(rejected(R"({"fusion": {"text_weight": 0.95}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"fusion": {"threshold": 1.5}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"features": {"tick_ms": 0}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"features": {"playback_threshold_multiplier": 0.5}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"context_threshold": {"min_threshold_ms": 6000}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"interruption": {"enabled": false}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"interruption": {"paused_min_utterance_ms": 1000}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"chunker": {"min_chars": 300}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"ducking": {"clear_volume": -0.1}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"backchannel": {"enabled": true, "phrases": []}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"remote": {"enabled": true, "endpoint": ""}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"remote": {"retry_backoff_ms": -1}})", ErrorType::InvalidConfig));
    ASSERT(rejected(R"({"backend": {"timeout_ms": 0}})", ErrorType::InvalidConfig));

    // Half-duplex is valid once pause/resume is off too
    ASSERT(EngineConfig::parse(R"({"interruption": {"enabled": false, "enable_pause_resume": false}})").is_ok());

    // --- Malformed input ---
    ASSERT(rejected("{\"fusion\": ", ErrorType::ParseError));
    ASSERT(rejected(R"({"features": {"tick_ms": "fast"}})", ErrorType::ParseError));
    {
        Result<EngineConfig> missing = EngineConfig::load("/nonexistent/turnkeeper.json");
        ASSERT(!missing);
        ASSERT(missing.error().type == ErrorType::InvalidConfig);
    }

    // --- Save and load ---
    {
        std::string path = (std::filesystem::temp_directory_path() / "turnkeeper_test_config.json").string();
        EngineConfig c = EngineConfig::defaults();
        c.ducking.enabled = false;
        c.audio.input_device = "USB Microphone";
        ASSERT(c.save(path).is_ok());
        Result<EngineConfig> loaded = EngineConfig::load(path);
        ASSERT(loaded.is_ok());
        ASSERT(!loaded.value().ducking.enabled);
        ASSERT(loaded.value().audio.input_device == "USB Microphone");
        std::remove(path.c_str());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
