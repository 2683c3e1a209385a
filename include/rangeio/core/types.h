#pragma once

/*
 * rangeio - Error model and Expected<T>
 *
 * Every fallible operation in the library returns Expected<T>. Errors carry a canonical
 * ErrorCode, a human readable message, an optional structured provider error (for HTTP error
 * responses) and an optional wrapped cause so that "request failed after N attempts" keeps the
 * last underlying failure around.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace rangeio {

using ByteSpan = std::span<const std::byte>;
using MutableByteSpan = std::span<std::byte>;
using ByteVector = std::vector<std::byte>;

/**
 * Canonical error codes.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,          // status >= 300
    MissingContentLength, // response without a declared length
    ProtocolViolation,    // server ignored or mangled a range request
    PolicyViolation,      // redirect policy refused a hop
    RetriesExhausted,
    InvalidSeek,
    OutOfBounds,
    ClosedHandle,
    ChecksumMismatch,
    Unverifiable,
    IoError,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::TlsVerificationFailed: return "TLS verification failed";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::MissingContentLength: return "Missing content length";
        case ErrorCode::ProtocolViolation: return "Protocol violation";
        case ErrorCode::PolicyViolation: return "Policy violation";
        case ErrorCode::RetriesExhausted: return "Retries exhausted";
        case ErrorCode::InvalidSeek: return "Invalid seek";
        case ErrorCode::OutOfBounds: return "Out of bounds";
        case ErrorCode::ClosedHandle: return "Operation on closed handle";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::Unverifiable: return "Unverifiable";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * Structured error parsed from a provider error response.
 * See https://docs.aws.amazon.com/AmazonS3/latest/API/ErrorResponses.html
 */
struct ResponseError {
    int statusCode{0};
    std::string code; // provider code, or the raw status line when no body could be parsed
    std::string message;
    std::string resource;
    std::string requestId;

    [[nodiscard]] std::string describe() const;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<ResponseError> response{};
    std::shared_ptr<const Error> cause{};

    /// Message followed by the chain of wrapped causes.
    [[nodiscard]] std::string describe() const;
};

/// Wraps `cause` under a new error; describe() then reads "message: cause".
[[nodiscard]] Error wrapError(ErrorCode code, std::string message, Error cause);

/// Innermost error of a wrapped chain (the error itself when nothing is wrapped).
[[nodiscard]] const Error& rootCause(const Error& error);

/**
 * Minimal Expected<T>: if ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

} // namespace rangeio
