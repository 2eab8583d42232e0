#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace turnkeeper {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
 * @return INFO for anything unrecognised
 */
LogLevel log_level_from_string(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Collaborator callbacks log from their own threads while the engine tick
 * logs from the main loop, so every write goes through one mutex.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) turnkeeper::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) turnkeeper::Logger::info(msg)
#define LOG_WARN(msg) turnkeeper::Logger::warn(msg)
#define LOG_ERROR(msg) turnkeeper::Logger::error(msg)

// Component-specific logging macros (per-tick detail at debug, transitions at info)
#define LOG_AUDIO(msg) turnkeeper::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) turnkeeper::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_SCORE(msg) turnkeeper::Logger::debug(std::string("[Score] ") + (msg))
#define LOG_FUSION(msg) turnkeeper::Logger::debug(std::string("[Fusion] ") + (msg))
#define LOG_BARGE(msg) turnkeeper::Logger::info(std::string("[Barge] ") + (msg))
#define LOG_QUEUE(msg) turnkeeper::Logger::info(std::string("[Queue] ") + (msg))
#define LOG_DUCK(msg) turnkeeper::Logger::debug(std::string("[Duck] ") + (msg))
#define LOG_BACKCHANNEL(msg) turnkeeper::Logger::info(std::string("[Backchannel] ") + (msg))
#define LOG_ENGINE(msg) turnkeeper::Logger::info(std::string("[Engine] ") + (msg))
#define LOG_REMOTE(msg) turnkeeper::Logger::info(std::string("[Remote] ") + (msg))
#define LOG_TRACE(session_id, stage, data) turnkeeper::Logger::info(std::string("[trace] session_id=") + std::to_string(session_id) + " stage=" + (stage) + " " + (data))

} // namespace turnkeeper
