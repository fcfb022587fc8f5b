#pragma once

#include <string>
#include <utility>

namespace gitv {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotARepository,
    IoError,
    CorruptObject,
    RefNotFound,
    UnsupportedFormat,
    InvalidTimestamp,
    ConfigError,
    InternalError
};

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/// Short name of an error code, used as a log prefix
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::IoError: return "io";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::RefNotFound: return "ref-not-found";
        case ErrorCode::UnsupportedFormat: return "unsupported-format";
        case ErrorCode::InvalidTimestamp: return "invalid-timestamp";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::InternalError: return "internal";
    }
    return "unknown";
}

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T value_or(T fallback) const { return hasValue ? value_ : std::move(fallback); }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
