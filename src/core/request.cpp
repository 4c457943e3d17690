#include "streamgate/core/request.hpp"

#include <algorithm>
#include <cctype>

namespace streamgate {

HttpMethod parse_method(std::string_view method) noexcept {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "DELETE") return HttpMethod::DELETE;
    if (method == "PATCH") return HttpMethod::PATCH;
    if (method == "HEAD") return HttpMethod::HEAD;
    if (method == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::string_view method_to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool Request::keep_alive() const noexcept {
    auto conn = header("Connection");
    if (conn) {
        if (iequals(*conn, "close")) return false;
        if (iequals(*conn, "keep-alive")) return true;
    }
    // HTTP/1.1 defaults to keep-alive
    return http_version_ == "HTTP/1.1";
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void parse_query(Request& req, std::string_view qs) {
    while (!qs.empty()) {
        auto amp = qs.find('&');
        std::string_view param = qs.substr(0, amp);
        if (!param.empty()) {
            auto eq = param.find('=');
            if (eq != std::string_view::npos) {
                req.add_query_param(url_decode(param.substr(0, eq), true),
                                    url_decode(param.substr(eq + 1), true));
            } else {
                req.add_query_param(url_decode(param, true), "");
            }
        }
        if (amp == std::string_view::npos) break;
        qs.remove_prefix(amp + 1);
    }
}

} // anonymous namespace

std::string url_decode(std::string_view str, bool plus_as_space) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        } else if (c == '+' && plus_as_space) {
            result += ' ';
            continue;
        }
        result += c;
    }
    return result;
}

expected<Request, Error> parse_request_head(std::string_view head) {
    auto bad_request = [](const char* msg) {
        return unexpected(Error::http(HttpError::BadRequest, msg));
    };

    auto line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    auto method_end = request_line.find(' ');
    if (method_end == std::string_view::npos) {
        return bad_request("Invalid request line");
    }
    auto path_end = request_line.find(' ', method_end + 1);
    if (path_end == std::string_view::npos) {
        return bad_request("Invalid request line");
    }

    Request req;
    req.set_method(request_line.substr(0, method_end));

    std::string_view target = request_line.substr(method_end + 1, path_end - method_end - 1);
    if (target.empty() || target.front() != '/') {
        return bad_request("Invalid request target");
    }

    auto query_start = target.find('?');
    req.set_path(url_decode(target.substr(0, query_start)));
    if (query_start != std::string_view::npos) {
        auto qs = target.substr(query_start + 1);
        req.set_query_string(std::string(qs));
        parse_query(req, qs);
    }

    auto version = request_line.substr(path_end + 1);
    if (!version.starts_with("HTTP/")) {
        return bad_request("Invalid HTTP version");
    }
    req.set_http_version(std::string(version));

    size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto header_end = head.find("\r\n", pos);
        if (header_end == std::string_view::npos) {
            header_end = head.size();
        }
        if (header_end == pos) {
            break;
        }

        std::string_view line = head.substr(pos, header_end - pos);
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return bad_request("Invalid header line");
        }
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }
        req.add_header(line.substr(0, colon), std::string(value));
        pos = header_end + 2;
    }

    return req;
}

} // namespace streamgate
