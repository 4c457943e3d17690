#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "streamgate/util/expected.hpp"
#include "streamgate/core/error.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/coro/cancellation.hpp"

namespace streamgate::net {

class Connection;

// ============================================================================
// Dispatcher - Hands work back to the thread that owns an I/O object
// ============================================================================

using Dispatcher = std::function<void(std::function<void()>)>;

// Dispatcher for the event-loop thread running the caller. Off the loop (tests,
// helper threads) the returned dispatcher runs callbacks inline.
Dispatcher current_dispatcher();

namespace detail {
// Installed by each event-loop worker for its own thread
void set_current_dispatcher(Dispatcher dispatcher);
} // namespace detail

// ============================================================================
// IoContext - Abstract I/O event loop
// ============================================================================

using ConnectionHandler = std::function<void(std::unique_ptr<Connection>)>;

class IoContext {
public:
    virtual ~IoContext() = default;

    // Run the event loop (blocking)
    virtual void run() = 0;

    virtual void stop() = 0;

    virtual bool stopped() const noexcept = 0;

    // Post a callback to be executed on the first worker
    virtual void post(std::function<void()> callback) = 0;

    // Each worker accepts on its own SO_REUSEPORT listener.
    // Returns false if not supported or failed.
    virtual bool enable_multi_accept(uint16_t port, ConnectionHandler handler, int backlog = 1024) {
        (void)port; (void)handler; (void)backlog;
        return false;
    }

    static std::unique_ptr<IoContext> create(size_t thread_count = 1);
};

// ============================================================================
// Async Operations
// ============================================================================

using AcceptResult = expected<std::unique_ptr<Connection>, Error>;
using ReadResult = expected<size_t, Error>;
using WriteResult = expected<size_t, Error>;
using TransmitResult = expected<size_t, Error>;

using FileHandle = int;

// ============================================================================
// Listener - Accepts incoming connections
// ============================================================================

class Listener {
public:
    virtual ~Listener() = default;

    virtual expected<void, Error> listen(uint16_t port, int backlog = 128) = 0;

    virtual Task<AcceptResult> async_accept() = 0;

    virtual void close() = 0;

    virtual bool is_listening() const noexcept = 0;

    virtual uint16_t local_port() const noexcept = 0;

    static std::unique_ptr<Listener> create(IoContext& ctx);
};

// ============================================================================
// Connection - Async read/write on a socket
// ============================================================================

class Connection {
public:
    virtual ~Connection() = default;

    virtual Task<ReadResult> async_read(void* buffer, size_t len) = 0;

    virtual Task<WriteResult> async_write(const void* buffer, size_t len) = 0;

    // Loops until all of the buffer is written
    virtual Task<WriteResult> async_write_all(const void* buffer, size_t len) = 0;

    // sendfile-based transfer of a file region
    virtual Task<TransmitResult> async_transmit_file(FileHandle file,
                                                      size_t offset,
                                                      size_t length) = 0;

    virtual void close() = 0;

    virtual bool is_open() const noexcept = 0;

    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    virtual std::string remote_address() const = 0;

    virtual uint16_t remote_port() const noexcept = 0;

    virtual void set_cancellation_token(CancellationToken token) = 0;
};

} // namespace streamgate::net
