#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "streamgate/core/error.hpp"
#include "streamgate/core/response.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/net/io_context.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate::stream {

using WriteStatus = expected<void, Error>;

// ============================================================================
// ResponseWriter - Commit-once channel back to the client
// ============================================================================

class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Sends the status line and headers. A second call throws
    // std::system_error(ProtocolError::AlreadyCommitted).
    virtual Task<WriteStatus> commit(int status, const Response::Headers& headers) = 0;

    // Body bytes; only after commit. Suspends until the client took them.
    virtual Task<WriteStatus> write(std::string_view chunk) = 0;

    // The body cannot be completed; the transport must not be reused
    virtual void abort() noexcept = 0;

    virtual bool committed() const noexcept = 0;

    // Commit plus the whole body in one step
    Task<WriteStatus> send(const Response& response);
};

// ============================================================================
// ConnectionResponseWriter - HTTP/1.1 framing over a net::Connection
// ============================================================================

class ConnectionResponseWriter : public ResponseWriter {
    net::Connection& conn_;
    Response::Headers extra_headers_;
    bool keep_alive_;
    bool head_;
    bool committed_ = false;
    bool aborted_ = false;
    uint64_t body_bytes_ = 0;

public:
    // extra_headers are appended to every committed header set. For a HEAD
    // request body writes are accepted and dropped.
    ConnectionResponseWriter(net::Connection& conn, Response::Headers extra_headers, bool keep_alive,
                             bool head = false)
        : conn_(conn)
        , extra_headers_(std::move(extra_headers))
        , keep_alive_(keep_alive)
        , head_(head) {}

    Task<WriteStatus> commit(int status, const Response::Headers& headers) override;
    Task<WriteStatus> write(std::string_view chunk) override;

    void abort() noexcept override { aborted_ = true; }

    bool committed() const noexcept override { return committed_; }
    bool aborted() const noexcept { return aborted_; }
    uint64_t body_bytes() const noexcept { return body_bytes_; }

    // Whether the connection may carry another request
    bool reusable() const noexcept { return keep_alive_ && !aborted_ && conn_.is_open(); }
};

} // namespace streamgate::stream
