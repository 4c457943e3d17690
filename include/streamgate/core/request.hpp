#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "streamgate/core/error.hpp"
#include "streamgate/util/expected.hpp"
#include "streamgate/util/from_string.hpp"

namespace streamgate {

// ============================================================================
// HTTP Method
// ============================================================================

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    PATCH,
    HEAD,
    OPTIONS,
    UNKNOWN
};

HttpMethod parse_method(std::string_view method) noexcept;
std::string_view method_to_string(HttpMethod method) noexcept;

// ASCII lowercase copy, used for header names
std::string to_lower(std::string_view s);

bool iequals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Request
// ============================================================================

class Request {
public:
    // Keys are stored lowercased
    using Headers = std::unordered_map<std::string, std::string>;
    using QueryParams = std::unordered_map<std::string, std::string>;

private:
    HttpMethod method_ = HttpMethod::GET;
    std::string path_;
    std::string query_string_;
    std::string http_version_ = "HTTP/1.1";
    Headers headers_;
    QueryParams query_params_;
    std::string body_;

    // Route parameters (filled by router after matching)
    std::vector<std::string> route_params_;

public:
    Request() = default;

    HttpMethod method() const noexcept { return method_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query_string() const noexcept { return query_string_; }
    std::string_view http_version() const noexcept { return http_version_; }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    void set_method(HttpMethod m) { method_ = m; }
    void set_method(std::string_view m) { method_ = parse_method(m); }
    void set_path(std::string p) { path_ = std::move(p); }
    void set_query_string(std::string qs) { query_string_ = std::move(qs); }
    void set_http_version(std::string v) { http_version_ = std::move(v); }
    void set_body(std::string b) { body_ = std::move(b); }

    // Repeated headers keep the last value
    void add_header(std::string_view key, std::string value) {
        headers_[to_lower(key)] = std::move(value);
    }

    void add_query_param(std::string key, std::string value) {
        query_params_[std::move(key)] = std::move(value);
    }

    void set_route_params(std::vector<std::string> params) {
        route_params_ = std::move(params);
    }

    const std::vector<std::string>& route_params() const noexcept {
        return route_params_;
    }

    const QueryParams& query_params() const noexcept { return query_params_; }

    // Positional route parameter (0-based)
    template<typename T = std::string>
    expected<T, Error> param(size_t index) const {
        if (index >= route_params_.size()) {
            return unexpected(Error::http(HttpError::BadRequest,
                "Route parameter index out of range: " + std::to_string(index)));
        }
        return from_string<T>(route_params_[index]);
    }

    // Case-insensitive
    std::optional<std::string_view> header(std::string_view key) const {
        auto it = headers_.find(to_lower(key));
        if (it != headers_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    template<typename T = std::string>
    std::optional<T> query_opt(std::string_view key) const {
        auto it = query_params_.find(std::string(key));
        if (it == query_params_.end()) {
            return std::nullopt;
        }
        return parse_optional<T>(it->second);
    }

    bool keep_alive() const noexcept;

    std::optional<size_t> content_length() const {
        auto cl = header("Content-Length");
        if (cl) {
            return parse_optional<size_t>(*cl);
        }
        return std::nullopt;
    }

    void reset() {
        method_ = HttpMethod::GET;
        path_.clear();
        query_string_.clear();
        http_version_ = "HTTP/1.1";
        headers_.clear();
        query_params_.clear();
        body_.clear();
        route_params_.clear();
    }
};

// ============================================================================
// HTTP/1.1 request head parsing
// ============================================================================

// Percent-decoding; '+' becomes a space only when plus_as_space is set
std::string url_decode(std::string_view str, bool plus_as_space = false);

// Parses the request line and headers (everything before the blank line).
// The path is percent-decoded and the query string split into parameters.
expected<Request, Error> parse_request_head(std::string_view head);

} // namespace streamgate
