#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "streamgate/core/error.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/stream/framer.hpp"
#include "streamgate/stream/range.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate::stream {

using ResourceId = std::string;

template<typename T>
using SourceResult = expected<T, SourceError>;

// One entry of a container listing
struct ChildEntry {
    std::string id;
    std::string name;
    std::string media_type;
    int64_t size = 0;
};

// ============================================================================
// StreamHandle - Open, forward-only byte source owned by one request
// ============================================================================

class StreamHandle {
public:
    // Implementations cancel the upstream transfer on destruction
    virtual ~StreamHandle() = default;

    // Next chunk; an empty view means the contracted bytes were all delivered.
    // The view stays valid until the next call. A backend that stops short is
    // reported as SourceError::Truncated.
    virtual Task<SourceResult<std::string_view>> read_chunk() = 0;

    // Idempotent, callable from any thread
    virtual void cancel() noexcept = 0;
};

// ============================================================================
// ContentSource - Backend-agnostic object store
// ============================================================================

class ContentSource {
public:
    virtual ~ContentSource() = default;

    // NotFound when the id does not resolve, Unavailable on backend failure
    virtual Task<SourceResult<ResourceMetadata>> get_metadata(const ResourceId& id) = 0;

    // With a range the handle yields exactly range.length() bytes from
    // range.start(); without one, the whole object
    virtual Task<SourceResult<std::unique_ptr<StreamHandle>>> open_stream(
        const ResourceId& id, std::optional<ByteRange> range) = 0;

    // Sorted by name, case-sensitive byte order, stable
    virtual Task<SourceResult<std::vector<ChildEntry>>> list_children(const ResourceId& container_id) = 0;

    // External thumbnail URL, if the backend has one
    virtual Task<SourceResult<std::optional<std::string>>> get_thumbnail_ref(const ResourceId& id) = 0;
};

} // namespace streamgate::stream
