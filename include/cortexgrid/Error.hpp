#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace cortexgrid {

enum class ErrorCategory {
    Protocol,
    Auth,
    Integrity,
    Capacity,
    Timeout,
    Network,
};

enum class ErrorCode {
    VersionMismatch,
    UnknownMessageKind,
    Malformed,
    UnexpectedMessage,
    NotFound,
    InvalidSignature,
    InvalidNodeId,
    ReplayDetected,
    DecryptionFailed,
    ChunkHashMismatch,
    PermanentlyFailed,
    QueueFull,
    NoEligiblePeer,
    Timeout,
    Cancelled,
    ConnectionReset,
    NotConnected,
    StorageFull,
};

ErrorCategory category_of(ErrorCode code) noexcept;
const char* to_string(ErrorCode code) noexcept;
const char* to_string(ErrorCategory category) noexcept;

// Maps an ERROR payload code back to a known ErrorCode.
std::optional<ErrorCode> error_code_from_wire(std::uint32_t code) noexcept;

struct Error {
    ErrorCode code{ErrorCode::Malformed};
    std::string message;

    ErrorCategory category() const noexcept { return category_of(code); }
};

inline Error make_error(ErrorCode code, std::string message = {}) {
    return Error{code, std::move(message)};
}

template <typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return std::get<T>(storage_); }
    const T& value() const& { return std::get<T>(storage_); }
    T&& value() && { return std::get<T>(std::move(storage_)); }

    T* operator->() { return &std::get<T>(storage_); }
    const T* operator->() const { return &std::get<T>(storage_); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    const Error& error() const { return std::get<Error>(storage_); }

private:
    std::variant<T, Error> storage_;
};

class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), failed_(true) {}

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    explicit operator bool() const noexcept { return ok(); }
    const Error& error() const noexcept { return error_; }

private:
    Error error_{};
    bool failed_{false};
};

}  // namespace cortexgrid
