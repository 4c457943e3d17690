#include "streamgate/core/mime_types.hpp"
#include "streamgate/core/request.hpp"

#include <string>
#include <unordered_map>

namespace streamgate {

namespace {

const std::unordered_map<std::string, std::string_view> media_types = {
    // Images
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"svg", "image/svg+xml"},

    // Video
    {"mp4", "video/mp4"},
    {"m4v", "video/x-m4v"},
    {"mkv", "video/x-matroska"},
    {"webm", "video/webm"},
    {"ogv", "video/ogg"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"ts", "video/mp2t"},

    // Audio
    {"mp3", "audio/mpeg"},
    {"m4a", "audio/mp4"},
    {"aac", "audio/aac"},
    {"flac", "audio/flac"},
    {"ogg", "audio/ogg"},
    {"opus", "audio/opus"},
    {"wav", "audio/wav"},

    // Subtitles
    {"srt", "application/x-subrip"},
    {"vtt", "text/vtt"},

    {"json", "application/json"},
    {"txt", "text/plain"},
};

} // anonymous namespace

std::string_view MimeTypes::get(std::string_view extension) noexcept {
    auto it = media_types.find(to_lower(extension));
    if (it != media_types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string_view MimeTypes::from_path(std::string_view path) noexcept {
    auto dot_pos = path.rfind('.');
    auto slash_pos = path.find_last_of("/\\");
    if (dot_pos == std::string_view::npos || dot_pos == path.size() - 1 ||
        (slash_pos != std::string_view::npos && dot_pos < slash_pos)) {
        return "application/octet-stream";
    }
    return get(path.substr(dot_pos + 1));
}

} // namespace streamgate
