#include "config.hpp"

#include <cstdlib>

#include "streamgate/util/from_string.hpp"

namespace mediahub {

namespace {

template<typename T>
T parse_number(std::string_view name, const std::string& value) {
    auto parsed = streamgate::from_string<T>(value);
    if (!parsed) {
        throw ConfigError(std::string(name) + ": invalid value '" + value + "'");
    }
    return *parsed;
}

std::string require(const Config::Lookup& lookup, std::string_view name) {
    auto value = lookup(name);
    if (!value || value->empty()) {
        throw ConfigError(std::string(name) + " is not set");
    }
    return *value;
}

} // anonymous namespace

Config Config::from_env() {
    return from_lookup([](std::string_view name) -> std::optional<std::string> {
        if (const char* value = std::getenv(std::string(name).c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    if (auto port = lookup("PORT")) {
        config.port = parse_number<uint16_t>("PORT", *port);
    }
    if (auto threads = lookup("THREADS")) {
        config.threads = parse_number<size_t>("THREADS", *threads);
        if (config.threads == 0) {
            throw ConfigError("THREADS: must be at least 1");
        }
    }

    // Credentials
    config.google_credentials = require(lookup, "GOOGLE_CREDENTIALS");
    config.refresh_token = require(lookup, "GOOGLE_REFRESH_TOKEN");
    if (auto base = lookup("DRIVE_API_BASE"); base && !base->empty()) {
        config.drive_api_base = *base;
    }

    // Library folders
    config.folders.movies = lookup("MOVIES_FOLDER_ID").value_or("");
    config.folders.tv = lookup("TV_FOLDER_ID").value_or("");
    config.folders.music = lookup("MUSIC_FOLDER_ID").value_or("");

    if (auto thumbnail = lookup("DEFAULT_THUMBNAIL"); thumbnail && !thumbnail->empty()) {
        config.default_thumbnail = *thumbnail;
    }
    if (auto origin = lookup("CORS_ORIGIN"); origin && !origin->empty()) {
        config.cors_origin = *origin;
    }

    if (auto level = lookup("LOG_LEVEL")) {
        config.log_level = streamgate::parse_log_level(*level);
    }
    if (auto format = lookup("LOG_FORMAT")) {
        config.log_format = *format;
    }

    return config;
}

} // namespace mediahub
