#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace montage {

// Engine error codes. Structural edits report these instead of throwing.
enum class ErrorCode {
    Ok,
    InvalidArg,
    OutOfRange,
    InvalidSplitPoint,
    EmptyInterval,
    NotReady,
    SourceMissing,
    DecodeFailed,
    Unsupported,
    Duplicate,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "Ok";
        case ErrorCode::InvalidArg:        return "InvalidArg";
        case ErrorCode::OutOfRange:        return "OutOfRange";
        case ErrorCode::InvalidSplitPoint: return "InvalidSplitPoint";
        case ErrorCode::EmptyInterval:     return "EmptyInterval";
        case ErrorCode::NotReady:          return "NotReady";
        case ErrorCode::SourceMissing:     return "SourceMissing";
        case ErrorCode::DecodeFailed:      return "DecodeFailed";
        case ErrorCode::Unsupported:       return "Unsupported";
        case ErrorCode::Duplicate:         return "Duplicate";
        case ErrorCode::Internal:          return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error out_of_range(const std::string& detail) {
        return {ErrorCode::OutOfRange, detail};
    }
    static Error invalid_split_point(double splitTimeMs) {
        return {ErrorCode::InvalidSplitPoint,
                "Split point outside clip: " + std::to_string(splitTimeMs) + "ms"};
    }
    static Error empty_interval(double startSec, double endSec) {
        return {ErrorCode::EmptyInterval,
                "Interval removes no frames: [" + std::to_string(startSec) + ", " +
                std::to_string(endSec) + ")"};
    }
    static Error not_ready(const std::string& detail) {
        return {ErrorCode::NotReady, detail};
    }
    static Error source_missing(const std::string& detail) {
        return {ErrorCode::SourceMissing, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error duplicate(const std::string& detail) {
        return {ErrorCode::Duplicate, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

    void unwrap() const {
        if (m_error) {
            throw std::runtime_error(m_error->message);
        }
    }

private:
    std::optional<Error> m_error;
};

} // namespace montage
