#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamgate {

// ============================================================================
// File Response Info (for zero-copy file serving)
// ============================================================================

struct FileResponseInfo {
    std::filesystem::path path;
    size_t offset = 0;
    size_t length = 0;
};

// ============================================================================
// Response
// ============================================================================

class Response {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    int status_ = 200;
    Headers headers_;
    std::string body_;
    std::optional<FileResponseInfo> file_info_;

public:
    Response() = default;

    Response(int status, Headers headers, std::string body)
        : status_(status)
        , headers_(std::move(headers))
        , body_(std::move(body)) {}

    int status() const noexcept { return status_; }
    std::string_view status_text() const noexcept { return reason_phrase(status_); }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    // First header with this name, compared case-insensitively
    std::optional<std::string_view> header(std::string_view key) const;

    // Replaces an existing header of the same name
    void set_header(std::string key, std::string value);

    void set_status(int status) { status_ = status; }

    void set_body(std::string body) { body_ = std::move(body); }

    std::string serialize() const;

    // Status line and headers only; the body goes out separately
    std::string serialize_headers() const;

    static Response ok(std::string body = "", std::string content_type = "text/plain");

    static Response json(std::string body, int status = 200);

    // {"error": "<message>"} with the given status
    static Response error(int status, std::string_view message);

    static Response no_content() {
        return Response(204, {}, "");
    }

    static Response redirect(std::string location, int status = 302) {
        return Response(status, {{"Location", std::move(location)}, {"Content-Length", "0"}}, "");
    }

    // Headers only; the file is sent with sendfile after them
    static Response file(const std::filesystem::path& path,
                         std::string_view content_type,
                         size_t file_size);

    bool has_file() const noexcept { return file_info_.has_value(); }
    const FileResponseInfo& file_info() const { return *file_info_; }

    static std::string_view reason_phrase(int status) noexcept;
};

} // namespace streamgate
