#pragma once

#include <cstdint>
#include <string_view>

#include "streamgate/core/logging.hpp"
#include "streamgate/core/request.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/stream/content_source.hpp"
#include "streamgate/stream/response_writer.hpp"

namespace streamgate::stream {

// Terminal states of one proxied request
enum class StreamState {
    Completed,      // every contracted byte delivered
    Aborted,        // client went away or backend failed after headers
    NotFound,       // 404 before headers
    BadGateway,     // 502 before headers
    Unsatisfiable   // 416, no stream opened
};

std::string_view to_string(StreamState state) noexcept;

struct StreamOutcome {
    StreamState state = StreamState::Completed;
    int status = 0;
    int64_t bytes_sent = 0;
};

// ============================================================================
// StreamingProxy - Range-aware pass-through from a ContentSource
// ============================================================================

// Per request: metadata -> range -> plan -> open stream -> headers -> copy loop.
// The stream is opened before the headers go out, so a backend refusal still
// produces a clean 404/502. The copy loop holds one chunk at a time and only
// asks for the next after the client has taken the previous one.
class StreamingProxy {
    ContentSource& source_;
    Logger& logger_;

public:
    explicit StreamingProxy(ContentSource& source, Logger& logger = default_logger())
        : source_(source)
        , logger_(logger) {}

    Task<StreamOutcome> serve(const Request& req, const ResourceId& id, ResponseWriter& writer);

private:
    // Error response before any header went out
    Task<StreamOutcome> refuse(const Request& req, ResponseWriter& writer, const ResourceId& id,
                               SourceError error, std::string_view stage);

    Task<StreamOutcome> pipe(std::unique_ptr<StreamHandle> handle, ResponseWriter& writer,
                             const ResourceId& id, const ResponsePlan& plan);

    void log_outcome(LogLevel level, std::string message, const ResourceId& id,
                     const StreamOutcome& outcome) const;
};

} // namespace streamgate::stream
