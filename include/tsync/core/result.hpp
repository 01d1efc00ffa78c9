#pragma once

#include <optional>
#include <string>
#include <variant>

namespace tsync {

/**
 * @brief Failure categories shared by every layer
 *
 * Connection, Timeout and Io are transient and may be retried.
 * Everything else is a definitive answer from the other side
 * (or from our own validation) and propagates immediately.
 */
enum class ErrorKind {
    Connection,
    Timeout,
    Io,
    NotFound,
    PermissionDenied,
    Transfer,
    Planning,
    Scheduling,
    CheckpointCorruption,
    InvalidArgument,
    Cancelled
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Io: return "io";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::Planning: return "planning";
        case ErrorKind::Scheduling: return "scheduling";
        case ErrorKind::CheckpointCorruption: return "checkpoint_corruption";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] bool retryable() const noexcept {
        return kind == ErrorKind::Connection || kind == ErrorKind::Timeout || kind == ErrorKind::Io;
    }

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace tsync
