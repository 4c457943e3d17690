#include "streamgate/drive/http.hpp"

#include <cctype>
#include <mutex>
#include <new>

namespace streamgate::drive {

namespace {

std::once_flag curl_init_flag;

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

Error transport_error(CURLcode rc) {
    return Error::source(SourceError::Unavailable, curl_easy_strerror(rc));
}

HttpResult perform(CURL* curl, const HttpOptions& options) {
    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        return unexpected(transport_error(rc));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // anonymous namespace

CurlEasy make_easy() {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    CurlEasy curl(curl_easy_init());
    if (!curl) {
        throw std::bad_alloc();
    }
    return curl;
}

CurlHeaderList make_header_list(const std::vector<std::string>& headers) {
    CurlHeaderList list;
    for (const auto& header : headers) {
        curl_slist* next = curl_slist_append(list.get(), header.c_str());
        if (!next) {
            throw std::bad_alloc();
        }
        // curl_slist_append returns the same head once the list is non-empty
        list.release();
        list.reset(next);
    }
    return list;
}

HttpResult http_get(const std::string& url, const std::vector<std::string>& headers,
                    const HttpOptions& options) {
    auto curl = make_easy();
    auto header_list = make_header_list(headers);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    return perform(curl.get(), options);
}

HttpResult http_post(const std::string& url, std::string_view body, std::string_view content_type,
                     const std::vector<std::string>& headers, const HttpOptions& options) {
    auto curl = make_easy();
    std::vector<std::string> all_headers = headers;
    all_headers.push_back("Content-Type: " + std::string(content_type));
    auto header_list = make_header_list(all_headers);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    return perform(curl.get(), options);
}

std::string url_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

} // namespace streamgate::drive
