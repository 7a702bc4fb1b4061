#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace core {

// Failure taxonomy shared by the pipeline and the connection layer.
enum class ErrorKind {
    Decode,
    Detector,
    Encode,
    SessionState,
    Protocol,
    Timeout,
    Internal
};

[[nodiscard]] inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode:       return "decode_error";
        case ErrorKind::Detector:     return "detector_error";
        case ErrorKind::Encode:       return "encode_error";
        case ErrorKind::SessionState: return "session_state_error";
        case ErrorKind::Protocol:     return "protocol_error";
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::Internal:     return "internal_error";
    }
    return "internal_error";
}

struct PipelineError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

/**
 * Value-or-error return used by stages that must not throw.
 */
template<typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(PipelineError error) : value_(std::move(error)) {}

    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(ErrorKind kind, std::string message) {
        return Result(PipelineError{kind, std::move(message)});
    }

    [[nodiscard]] bool isOk() const { return std::holds_alternative<T>(value_); }
    [[nodiscard]] bool isErr() const { return !isOk(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!isOk()) {
            throw std::logic_error("Result::value on error: " + std::get<PipelineError>(value_).message);
        }
        return std::get<T>(value_);
    }

    T&& value() && {
        if (!isOk()) {
            throw std::logic_error("Result::value on error: " + std::get<PipelineError>(value_).message);
        }
        return std::get<T>(std::move(value_));
    }

    const PipelineError& error() const {
        if (isOk()) {
            throw std::logic_error("Result::error on success value");
        }
        return std::get<PipelineError>(value_);
    }

private:
    std::variant<T, PipelineError> value_;
};

/**
 * Thrown at startup for invalid or unreadable configuration.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace core
