#include "streamgate/stream/range.hpp"
#include "streamgate/core/request.hpp"

#include <algorithm>
#include <charconv>

namespace streamgate::stream {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

// Digits only; signs, blanks inside and overflow are rejected
std::optional<int64_t> parse_position(std::string_view s) {
    if (s.empty() || s.front() < '0' || s.front() > '9') {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

RangeResult parse_range(std::optional<std::string_view> header, int64_t total) {
    if (!header) {
        return std::optional<ByteRange>{};
    }

    auto value = trim(*header);
    auto eq = value.find('=');
    if (eq == std::string_view::npos || !iequals(trim(value.substr(0, eq)), "bytes")) {
        return unexpected(RangeError::Malformed);
    }

    auto spec = trim(value.substr(eq + 1));
    if (spec.find(',') != std::string_view::npos) {
        return unexpected(RangeError::Malformed);
    }

    auto dash = spec.find('-');
    if (dash == std::string_view::npos) {
        return unexpected(RangeError::Malformed);
    }

    auto first = trim(spec.substr(0, dash));
    auto last = trim(spec.substr(dash + 1));
    if (first.empty() && last.empty()) {
        return unexpected(RangeError::Malformed);
    }

    // Suffix form: the last N bytes
    if (first.empty()) {
        auto suffix = parse_position(last);
        if (!suffix || *suffix == 0 || total <= 0) {
            return unexpected(RangeError::Unsatisfiable);
        }
        int64_t start = *suffix >= total ? 0 : total - *suffix;
        return std::optional<ByteRange>(ByteRange(start, total - 1, total));
    }

    auto start = parse_position(first);
    if (!start || total <= 0 || *start >= total) {
        return unexpected(RangeError::Unsatisfiable);
    }

    int64_t end = total - 1;
    if (!last.empty()) {
        auto requested = parse_position(last);
        if (!requested || *requested < *start) {
            return unexpected(RangeError::Unsatisfiable);
        }
        end = std::min(*requested, total - 1);
    }

    return std::optional<ByteRange>(ByteRange(*start, end, total));
}

std::string ByteRange::content_range() const {
    return "bytes " + std::to_string(start_) + "-" + std::to_string(end_) + "/" + std::to_string(total_);
}

std::string ByteRange::request_header() const {
    return "bytes=" + std::to_string(start_) + "-" + std::to_string(end_);
}

} // namespace streamgate::stream
