#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <system_error>

namespace streamgate {

// ============================================================================
// I/O Errors (transport layer)
// ============================================================================

enum class IoError {
    Success = 0,
    ConnectionReset,
    ConnectionAborted,
    Timeout,
    Cancelled,
    EndOfStream,
    InvalidArgument,
    Unknown
};

// ============================================================================
// HTTP Errors (protocol layer)
// ============================================================================

enum class HttpError {
    BadRequest = 400,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    RangeNotSatisfiable = 416,

    Internal = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503
};

// ============================================================================
// Streaming Errors
// ============================================================================

// Outcome of interpreting a Range header against a resource length
enum class RangeError {
    Malformed = 1,      // not parseable at all; served as full content
    Unsatisfiable       // parseable but outside the resource; 416
};

// Failures reported by a content backend
enum class SourceError {
    NotFound = 1,
    Unavailable,
    Truncated           // stream ended before the contracted byte count
};

// Misuse of a response channel
enum class ProtocolError {
    AlreadyCommitted = 1
};

} // namespace streamgate

template<>
struct std::is_error_code_enum<streamgate::IoError> : std::true_type {};

template<>
struct std::is_error_code_enum<streamgate::HttpError> : std::true_type {};

template<>
struct std::is_error_code_enum<streamgate::RangeError> : std::true_type {};

template<>
struct std::is_error_code_enum<streamgate::SourceError> : std::true_type {};

template<>
struct std::is_error_code_enum<streamgate::ProtocolError> : std::true_type {};

namespace streamgate {

const std::error_category& io_error_category() noexcept;
std::error_code make_error_code(IoError e) noexcept;

const std::error_category& http_error_category() noexcept;
std::error_code make_error_code(HttpError e) noexcept;

const std::error_category& range_error_category() noexcept;
std::error_code make_error_code(RangeError e) noexcept;

const std::error_category& source_error_category() noexcept;
std::error_code make_error_code(SourceError e) noexcept;

const std::error_category& protocol_error_category() noexcept;
std::error_code make_error_code(ProtocolError e) noexcept;

std::string_view to_string(SourceError e) noexcept;
std::string_view to_string(RangeError e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
public:
    using Variant = std::variant<IoError, HttpError, std::error_code>;

private:
    Variant inner_;
    std::string message_;

public:
    Error() : inner_(IoError::Success) {}

    Error(IoError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(HttpError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    static Error io(IoError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error http(HttpError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error system(std::error_code ec) {
        return Error(ec);
    }

    static Error source(SourceError e, std::string msg = "") {
        return Error(make_error_code(e), std::move(msg));
    }

    static Error cancelled() {
        return Error(IoError::Cancelled, "Operation cancelled");
    }

    static Error timeout() {
        return Error(IoError::Timeout, "Operation timed out");
    }

    bool is_io() const noexcept {
        return std::holds_alternative<IoError>(inner_);
    }

    bool is_http() const noexcept {
        return std::holds_alternative<HttpError>(inner_);
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    bool is_cancelled() const noexcept {
        return is_io() && std::get<IoError>(inner_) == IoError::Cancelled;
    }

    bool is_timeout() const noexcept {
        return is_io() && std::get<IoError>(inner_) == IoError::Timeout;
    }

    IoError io_error() const noexcept {
        return is_io() ? std::get<IoError>(inner_) : IoError::Unknown;
    }

    HttpError http_error() const noexcept {
        return is_http() ? std::get<HttpError>(inner_) : HttpError::Internal;
    }

    std::error_code system_error() const noexcept {
        return is_system() ? std::get<std::error_code>(inner_) : std::error_code{};
    }

    std::error_code code() const noexcept;

    // HTTP status code a handler should answer with for this error
    int http_status() const noexcept;

    std::string_view message() const noexcept {
        return message_;
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    explicit operator bool() const noexcept {
        if (is_io()) return std::get<IoError>(inner_) != IoError::Success;
        if (is_http()) return true;
        return static_cast<bool>(std::get<std::error_code>(inner_));
    }
};

} // namespace streamgate
