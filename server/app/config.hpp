#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "streamgate/core/logging.hpp"

namespace mediahub {

// Invalid or missing setting; the message names the variable
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LibraryFolders {
    std::string movies;
    std::string tv;
    std::string music;
};

struct Config {
    // Server settings
    uint16_t port = 3000;
    size_t threads = 1;

    // Google Drive
    std::string google_credentials;
    std::string refresh_token;
    std::string drive_api_base = "https://www.googleapis.com/drive/v3";
    LibraryFolders folders;

    std::filesystem::path default_thumbnail = "default-thumbnail.jpg";
    std::string cors_origin = "*";

    // Logging
    streamgate::LogLevel log_level = streamgate::LogLevel::Info;
    std::string log_format = "text";

    // Reads the process environment
    static Config from_env();

    // Same rules over an arbitrary variable lookup
    using Lookup = std::function<std::optional<std::string>(std::string_view name)>;
    static Config from_lookup(const Lookup& lookup);
};

} // namespace mediahub
