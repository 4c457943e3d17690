#include "streamgate/core/error.hpp"
#include <sstream>

namespace streamgate {

// ============================================================================
// Categories
// ============================================================================

namespace {

class IoErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "streamgate.io";
    }

    std::string message(int ev) const override {
        switch (static_cast<IoError>(ev)) {
            case IoError::Success: return "Success";
            case IoError::ConnectionReset: return "Connection reset";
            case IoError::ConnectionAborted: return "Connection aborted";
            case IoError::Timeout: return "Operation timed out";
            case IoError::Cancelled: return "Operation cancelled";
            case IoError::EndOfStream: return "End of stream";
            case IoError::InvalidArgument: return "Invalid argument";
            case IoError::Unknown: return "Unknown error";
            default: return "Unknown I/O error";
        }
    }
};

class HttpErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "streamgate.http";
    }

    std::string message(int ev) const override {
        switch (static_cast<HttpError>(ev)) {
            case HttpError::BadRequest: return "Bad Request";
            case HttpError::NotFound: return "Not Found";
            case HttpError::MethodNotAllowed: return "Method Not Allowed";
            case HttpError::RequestTimeout: return "Request Timeout";
            case HttpError::PayloadTooLarge: return "Payload Too Large";
            case HttpError::RangeNotSatisfiable: return "Range Not Satisfiable";
            case HttpError::Internal: return "Internal Server Error";
            case HttpError::NotImplemented: return "Not Implemented";
            case HttpError::BadGateway: return "Bad Gateway";
            case HttpError::ServiceUnavailable: return "Service Unavailable";
            default: return "Unknown HTTP error";
        }
    }
};

class RangeErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "streamgate.range";
    }

    std::string message(int ev) const override {
        return std::string(to_string(static_cast<RangeError>(ev)));
    }
};

class SourceErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "streamgate.source";
    }

    std::string message(int ev) const override {
        return std::string(to_string(static_cast<SourceError>(ev)));
    }
};

class ProtocolErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "streamgate.protocol";
    }

    std::string message(int ev) const override {
        switch (static_cast<ProtocolError>(ev)) {
            case ProtocolError::AlreadyCommitted: return "Response headers already committed";
            default: return "Unknown protocol error";
        }
    }
};

const IoErrorCategory io_category_instance{};
const HttpErrorCategory http_category_instance{};
const RangeErrorCategory range_category_instance{};
const SourceErrorCategory source_category_instance{};
const ProtocolErrorCategory protocol_category_instance{};

} // anonymous namespace

std::string_view to_string(RangeError e) noexcept {
    switch (e) {
        case RangeError::Malformed: return "Malformed range";
        case RangeError::Unsatisfiable: return "Range not satisfiable";
        default: return "Unknown range error";
    }
}

std::string_view to_string(SourceError e) noexcept {
    switch (e) {
        case SourceError::NotFound: return "Resource not found";
        case SourceError::Unavailable: return "Backend unavailable";
        case SourceError::Truncated: return "Stream truncated";
        default: return "Unknown source error";
    }
}

const std::error_category& io_error_category() noexcept {
    return io_category_instance;
}

const std::error_category& http_error_category() noexcept {
    return http_category_instance;
}

const std::error_category& range_error_category() noexcept {
    return range_category_instance;
}

const std::error_category& source_error_category() noexcept {
    return source_category_instance;
}

const std::error_category& protocol_error_category() noexcept {
    return protocol_category_instance;
}

std::error_code make_error_code(IoError e) noexcept {
    return {static_cast<int>(e), io_error_category()};
}

std::error_code make_error_code(HttpError e) noexcept {
    return {static_cast<int>(e), http_error_category()};
}

std::error_code make_error_code(RangeError e) noexcept {
    return {static_cast<int>(e), range_error_category()};
}

std::error_code make_error_code(SourceError e) noexcept {
    return {static_cast<int>(e), source_error_category()};
}

std::error_code make_error_code(ProtocolError e) noexcept {
    return {static_cast<int>(e), protocol_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

std::error_code Error::code() const noexcept {
    if (is_io()) {
        return make_error_code(std::get<IoError>(inner_));
    }
    if (is_http()) {
        return make_error_code(std::get<HttpError>(inner_));
    }
    return std::get<std::error_code>(inner_);
}

int Error::http_status() const noexcept {
    if (is_http()) {
        return static_cast<int>(std::get<HttpError>(inner_));
    }
    if (is_io()) {
        switch (std::get<IoError>(inner_)) {
            case IoError::Timeout: return 408;
            case IoError::Cancelled: return 499; // Client Closed Request
            default: return 500;
        }
    }
    auto ec = std::get<std::error_code>(inner_);
    if (ec.category() == source_error_category()) {
        return ec == SourceError::NotFound ? 404 : 502;
    }
    if (ec.category() == range_error_category()) {
        return ec == RangeError::Unsatisfiable ? 416 : 400;
    }
    return 500;
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_io()) {
        oss << "IoError::" << io_error_category().message(static_cast<int>(std::get<IoError>(inner_)));
    } else if (is_http()) {
        auto e = std::get<HttpError>(inner_);
        oss << "HttpError::" << static_cast<int>(e) << " " << http_error_category().message(static_cast<int>(e));
    } else {
        auto ec = std::get<std::error_code>(inner_);
        oss << ec.category().name() << ":" << ec.value() << " " << ec.message();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace streamgate
