#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "streamgate/core/error.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate::stream {

class ByteRange;

// nullopt means "serve the whole resource"
using RangeResult = expected<std::optional<ByteRange>, RangeError>;

// ============================================================================
// Range Parsing
// ============================================================================

// Resolves a Range header value against a resource of `total` bytes.
// Single ranges only: "bytes=0-499", "bytes=500-", "bytes=-500".
//   absent header            -> nullopt
//   unparseable syntax       -> RangeError::Malformed
//   parseable but outside    -> RangeError::Unsatisfiable
// An end past the resource is clamped to total - 1.
RangeResult parse_range(std::optional<std::string_view> header, int64_t total);

// ============================================================================
// ByteRange - Validated, inclusive byte interval of a resource
// ============================================================================

class ByteRange {
    int64_t start_;
    int64_t end_;
    int64_t total_;

    // 0 <= start <= end < total
    ByteRange(int64_t start, int64_t end, int64_t total) noexcept
        : start_(start), end_(end), total_(total) {}

    friend RangeResult parse_range(std::optional<std::string_view> header, int64_t total);

public:
    int64_t start() const noexcept { return start_; }
    int64_t end() const noexcept { return end_; }
    int64_t total() const noexcept { return total_; }

    int64_t length() const noexcept { return end_ - start_ + 1; }

    // "bytes 200-499/1000"
    std::string content_range() const;

    // "bytes=200-499", as sent to a backend
    std::string request_header() const;

    bool operator==(const ByteRange&) const = default;
};

} // namespace streamgate::stream
