#include "streamgate/core/response.hpp"
#include "streamgate/core/json.hpp"
#include "streamgate/core/request.hpp"

namespace streamgate {

namespace {

void append_head(std::string& out, int status, const Response::Headers& headers) {
    out += "HTTP/1.1 ";
    out += std::to_string(status);
    out += ' ';
    out += Response::reason_phrase(status);
    out += "\r\n";
    for (const auto& [key, value] : headers) {
        out += key;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";
}

} // anonymous namespace

std::optional<std::string_view> Response::header(std::string_view key) const {
    for (const auto& [k, v] : headers_) {
        if (iequals(k, key)) {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

void Response::set_header(std::string key, std::string value) {
    for (auto& [k, v] : headers_) {
        if (iequals(k, key)) {
            v = std::move(value);
            return;
        }
    }
    headers_.emplace_back(std::move(key), std::move(value));
}

std::string Response::serialize() const {
    std::string out;
    out.reserve(128 + body_.size());
    append_head(out, status_, headers_);
    out += body_;
    return out;
}

std::string Response::serialize_headers() const {
    std::string out;
    out.reserve(128);
    append_head(out, status_, headers_);
    return out;
}

Response Response::ok(std::string body, std::string content_type) {
    Response r;
    r.body_ = std::move(body);
    r.headers_.emplace_back("Content-Type", std::move(content_type));
    r.headers_.emplace_back("Content-Length", std::to_string(r.body_.size()));
    return r;
}

Response Response::json(std::string body, int status) {
    Response r = ok(std::move(body), "application/json");
    r.status_ = status;
    return r;
}

Response Response::error(int status, std::string_view message) {
    JsonValue body = JsonValue::object();
    body["error"] = std::string(message);
    return json(body.dump(), status);
}

Response Response::file(const std::filesystem::path& path,
                        std::string_view content_type,
                        size_t file_size) {
    Response r;
    r.headers_.emplace_back("Content-Type", std::string(content_type));
    r.headers_.emplace_back("Content-Length", std::to_string(file_size));
    r.file_info_ = FileResponseInfo{path, 0, file_size};
    return r;
}

std::string_view Response::reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";

        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";

        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 416: return "Range Not Satisfiable";

        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";

        default: return "Unknown";
    }
}

} // namespace streamgate
