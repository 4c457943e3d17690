#include "streamgate/stream/proxy.hpp"

#include <algorithm>

namespace streamgate::stream {

std::string_view to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Completed: return "completed";
        case StreamState::Aborted: return "aborted";
        case StreamState::NotFound: return "not_found";
        case StreamState::BadGateway: return "bad_gateway";
        case StreamState::Unsatisfiable: return "unsatisfiable";
    }
    return "unknown";
}

void StreamingProxy::log_outcome(LogLevel level, std::string message, const ResourceId& id,
                                 const StreamOutcome& outcome) const {
    if (!logger_.is_enabled(level)) {
        return;
    }
    auto entry = logger_.entry(level, std::move(message));
    entry.field("id", id);
    entry.field("status", outcome.status);
    entry.field("bytes", outcome.bytes_sent);
    entry.field("outcome", to_string(outcome.state));
    logger_.log(entry);
}

Task<StreamOutcome> StreamingProxy::serve(const Request& req, const ResourceId& id, ResponseWriter& writer) {
    auto metadata = co_await source_.get_metadata(id);
    if (!metadata) {
        co_return co_await refuse(req, writer, id, metadata.error(), "metadata");
    }

    auto range = parse_range(req.header("Range"), metadata->size);
    if (!range && range.error() == RangeError::Malformed) {
        logger_.debug("Ignoring malformed Range header for " + id);
    }

    ResponsePlan plan = frame(*metadata, range);

    if (plan.status == 416 || req.method() == HttpMethod::HEAD) {
        StreamOutcome outcome{plan.status == 416 ? StreamState::Unsatisfiable : StreamState::Completed,
                              plan.status, 0};
        auto committed = co_await writer.commit(plan.status, plan.headers);
        if (!committed) {
            outcome.state = StreamState::Aborted;
        }
        log_outcome(LogLevel::Info, "Stream headers only", id, outcome);
        co_return outcome;
    }

    auto opened = co_await source_.open_stream(id, plan.range);
    if (!opened) {
        co_return co_await refuse(req, writer, id, opened.error(), "open");
    }

    co_return co_await pipe(std::move(*opened), writer, id, plan);
}

Task<StreamOutcome> StreamingProxy::refuse(const Request& req, ResponseWriter& writer, const ResourceId& id,
                                           SourceError error, std::string_view stage) {
    StreamOutcome outcome;
    if (error == SourceError::NotFound) {
        outcome.state = StreamState::NotFound;
        outcome.status = 404;
    } else {
        outcome.state = StreamState::BadGateway;
        outcome.status = 502;
    }

    auto entry = logger_.entry(LogLevel::Warn, "Backend refused stream");
    entry.field("id", id);
    entry.field("stage", stage);
    entry.field("error", to_string(error));
    logger_.log(entry);

    auto body = outcome.status == 404 ? "Content not found" : "Failed to stream content";
    Response resp = Response::error(outcome.status, body);
    WriteStatus sent;
    if (req.method() == HttpMethod::HEAD) {
        // The error's headers, Content-Length included, and no body
        sent = co_await writer.commit(resp.status(), resp.headers());
    } else {
        sent = co_await writer.send(resp);
    }
    if (!sent) {
        writer.abort();
    }
    co_return outcome;
}

Task<StreamOutcome> StreamingProxy::pipe(std::unique_ptr<StreamHandle> handle, ResponseWriter& writer,
                                         const ResourceId& id, const ResponsePlan& plan) {
    StreamOutcome outcome{StreamState::Aborted, plan.status, 0};
    const int64_t contracted = plan.body_length();

    auto committed = co_await writer.commit(plan.status, plan.headers);
    if (!committed) {
        handle->cancel();
        handle.reset();
        log_outcome(LogLevel::Info, "Client disconnected before body", id, outcome);
        co_return outcome;
    }

    while (outcome.bytes_sent < contracted) {
        auto chunk = co_await handle->read_chunk();
        if (!chunk) {
            handle->cancel();
            handle.reset();
            writer.abort();
            auto entry = logger_.entry(LogLevel::Warn, "Backend stream failed");
            entry.field("id", id);
            entry.field("error", to_string(chunk.error()));
            entry.field("bytes", outcome.bytes_sent);
            logger_.log(entry);
            co_return outcome;
        }
        if (chunk->empty()) {
            break;
        }

        // Never send past the Content-Length already promised
        auto remaining = static_cast<size_t>(contracted - outcome.bytes_sent);
        std::string_view data = chunk->substr(0, std::min(chunk->size(), remaining));

        auto written = co_await writer.write(data);
        if (!written) {
            handle->cancel();
            handle.reset();
            writer.abort();
            log_outcome(LogLevel::Info, "Client disconnected", id, outcome);
            co_return outcome;
        }
        outcome.bytes_sent += static_cast<int64_t>(data.size());
    }

    handle.reset();

    if (outcome.bytes_sent != contracted) {
        writer.abort();
        log_outcome(LogLevel::Warn, "Backend stream ended early", id, outcome);
        co_return outcome;
    }

    outcome.state = StreamState::Completed;
    log_outcome(LogLevel::Info, "Stream completed", id, outcome);
    co_return outcome;
}

} // namespace streamgate::stream
