#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "streamgate/core/response.hpp"
#include "streamgate/stream/range.hpp"

namespace streamgate::stream {

// Snapshot of a backend object, fetched once per request
struct ResourceMetadata {
    int64_t size = 0;
    std::string media_type;
    std::string name;
};

// ============================================================================
// ResponsePlan - Status and headers decided before any byte is sent
// ============================================================================

struct ResponsePlan {
    int status = 200;
    Response::Headers headers;
    std::optional<ByteRange> range;   // set only for 206

    // Bytes the body must carry; 0 for 416
    int64_t body_length() const;

    std::optional<std::string_view> header(std::string_view name) const;

    bool operator==(const ResponsePlan&) const = default;
};

// Pure: equal inputs give equal plans, headers in a fixed order.
//   no range / Malformed -> 200  Content-Length, Content-Type
//   valid range          -> 206  Content-Range, Accept-Ranges, Content-Length, Content-Type
//   Unsatisfiable        -> 416  Content-Range: bytes */<size>
ResponsePlan frame(const ResourceMetadata& metadata, const RangeResult& range);

} // namespace streamgate::stream
