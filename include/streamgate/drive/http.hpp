#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

#include "streamgate/core/error.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate::drive {

// ============================================================================
// libcurl handles
// ============================================================================

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlListDeleter>;

// curl_global_init runs once per process, before the first handle
CurlEasy make_easy();

CurlHeaderList make_header_list(const std::vector<std::string>& headers);

// ============================================================================
// Blocking request helpers
// ============================================================================

struct HttpOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Transport failures only; any HTTP status is a successful HttpResponse
using HttpResult = expected<HttpResponse, Error>;

HttpResult http_get(const std::string& url, const std::vector<std::string>& headers,
                    const HttpOptions& options = {});

HttpResult http_post(const std::string& url, std::string_view body, std::string_view content_type,
                     const std::vector<std::string>& headers = {}, const HttpOptions& options = {});

// RFC 3986 percent-encoding; unreserved characters pass through
std::string url_encode(std::string_view value);

// "k1=v1&k2=v2" with both sides percent-encoded
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace streamgate::drive
