#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace turnkeeper {

/**
 * @brief Error types for different failure modes
 *
 * Everything except DeviceError is recoverable: components fall back to a
 * conservative default (wait instead of taking the turn, pause instead of
 * losing state) and the conversation keeps listening.
 */
enum class ErrorType {
    None,
    SignalError,          ///< Malformed or empty audio frame
    ScorerUnavailable,    ///< Text or audio scorer could not produce a score
    CollaboratorTimeout,  ///< Transcription/chat/synthesis request timed out
    CollaboratorError,    ///< Transcription/chat/synthesis request failed
    CancellationRace,     ///< Response arrived after its session was superseded
    DeviceError,          ///< No capture/playback device (fatal)
    InvalidConfig,
    ParseError,
    NetworkError,
    Unknown
};

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::SignalError: return "SignalError";
        case ErrorType::ScorerUnavailable: return "ScorerUnavailable";
        case ErrorType::CollaboratorTimeout: return "CollaboratorTimeout";
        case ErrorType::CollaboratorError: return "CollaboratorError";
        case ErrorType::CancellationRace: return "CancellationRace";
        case ErrorType::DeviceError: return "DeviceError";
        case ErrorType::InvalidConfig: return "InvalidConfig";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// Only device-level failures are surfaced to the caller as fatal
    bool is_fatal() const { return type == ErrorType::DeviceError; }

    std::string to_string() const {
        return std::string(error_type_to_string(type)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::InvalidConfig, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceError, message);
}

inline Error make_timeout_error(const std::string& message = "Collaborator request timed out") {
    return Error(ErrorType::CollaboratorTimeout, message);
}

} // namespace turnkeeper
