#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "streamgate/util/expected.hpp"
#include "streamgate/core/error.hpp"

namespace streamgate {

// ============================================================================
// FromString trait - Convert string to type T
// ============================================================================

template<typename T, typename = void>
struct FromString;

// Integral types use std::from_chars; the whole input must be consumed
template<typename T>
struct FromString<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static expected<T, Error> parse(std::string_view s) {
        if (s.empty()) {
            return unexpected(Error::http(HttpError::BadRequest, "Empty parameter"));
        }

        T value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }

        if (ec == std::errc::result_out_of_range) {
            return unexpected(Error::http(HttpError::BadRequest,
                "Parameter out of range: " + std::string(s)));
        }

        return unexpected(Error::http(HttpError::BadRequest,
            "Invalid integer: " + std::string(s)));
    }
};

template<>
struct FromString<bool> {
    static expected<bool, Error> parse(std::string_view s) {
        if (s == "true" || s == "1" || s == "yes" || s == "on") {
            return true;
        }
        if (s == "false" || s == "0" || s == "no" || s == "off") {
            return false;
        }
        return unexpected(Error::http(HttpError::BadRequest,
            "Invalid boolean: " + std::string(s)));
    }
};

template<>
struct FromString<std::string> {
    static expected<std::string, Error> parse(std::string_view s) {
        return std::string(s);
    }
};

template<typename T>
expected<T, Error> from_string(std::string_view s) {
    return FromString<T>::parse(s);
}

// Parsed value or nullopt; for call sites that treat bad input as absent
template<typename T>
std::optional<T> parse_optional(std::string_view s) {
    auto result = FromString<T>::parse(s);
    if (!result) {
        return std::nullopt;
    }
    return *result;
}

} // namespace streamgate
