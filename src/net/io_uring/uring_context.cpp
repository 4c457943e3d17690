#include "streamgate/net/io_context.hpp"

#if defined(STREAMGATE_PLATFORM_LINUX)

#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/sendfile.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>

#include <atomic>
#include <cerrno>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace streamgate::net {

// ============================================================================
// io_uring Operation
// ============================================================================

struct UringOperation {
    std::coroutine_handle<> continuation;
    Error error;
    int result = 0;

    int accept_fd = -1;
    sockaddr_in client_addr{};
    socklen_t client_addr_len = sizeof(sockaddr_in);
};

// Captures the continuation before suspending; the completion loop resumes it
struct UringAwaiter {
    UringOperation& op;

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> h) noexcept {
        op.continuation = h;
    }

    void await_resume() const noexcept {}
};

namespace {

Error errno_error(int err) {
    return Error::system(std::error_code(err, std::system_category()));
}

int open_listen_socket(uint16_t port, int backlog, bool reuse_port) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (fd < 0) return -1;

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (reuse_port) {
        setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, backlog) < 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;
}

void set_tcp_opts(int fd) {
    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    int sndbuf = 256 * 1024;
    setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf));
}

} // anonymous namespace

// ============================================================================
// Worker Ring - one io_uring instance, listener and callback queue per thread
// ============================================================================

struct WorkerRing {
    io_uring ring;
    int eventfd = -1;
    int listen_fd = -1;
    bool initialized = false;

    std::mutex callback_mutex;
    std::queue<std::function<void()>> callbacks;

    WorkerRing() = default;

    ~WorkerRing() {
        if (listen_fd >= 0) {
            ::close(listen_fd);
        }
        if (initialized) {
            ::close(eventfd);
            io_uring_queue_exit(&ring);
        }
    }

    WorkerRing(const WorkerRing&) = delete;
    WorkerRing& operator=(const WorkerRing&) = delete;

    bool init() {
        io_uring_params params{};
        if (io_uring_queue_init_params(4096, &ring, &params) < 0) {
            return false;
        }

        eventfd = ::eventfd(0, EFD_NONBLOCK);
        if (eventfd < 0) {
            io_uring_queue_exit(&ring);
            return false;
        }

        initialized = true;
        return true;
    }

    void wake() {
        uint64_t val = 1;
        [[maybe_unused]] auto n = ::write(eventfd, &val, sizeof(val));
    }

    void post(std::function<void()> callback) {
        {
            std::lock_guard lock(callback_mutex);
            callbacks.push(std::move(callback));
        }
        wake();
    }

    void drain_callbacks() {
        for (int i = 0; i < 64; ++i) {
            std::function<void()> callback;
            {
                std::lock_guard lock(callback_mutex);
                if (callbacks.empty()) return;
                callback = std::move(callbacks.front());
                callbacks.pop();
            }
            callback();
        }
    }
};

// ============================================================================
// io_uring Context
// ============================================================================

class UringContext : public IoContext {
    std::vector<std::unique_ptr<WorkerRing>> rings_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopped_{false};

    ConnectionHandler connection_handler_;
    bool multi_accept_enabled_ = false;

public:
    explicit UringContext(size_t thread_count) {
        size_t count = thread_count > 0 ? thread_count : 1;
        rings_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            auto ring = std::make_unique<WorkerRing>();
            if (!ring->init()) {
                throw std::runtime_error("Failed to initialize io_uring ring " + std::to_string(i));
            }
            rings_.push_back(std::move(ring));
        }
    }

    ~UringContext() override {
        stop();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    bool enable_multi_accept(uint16_t port, ConnectionHandler handler, int backlog) override {
        for (auto& ring : rings_) {
            ring->listen_fd = open_listen_socket(port, backlog, true);
            if (ring->listen_fd < 0) {
                for (auto& r : rings_) {
                    if (r->listen_fd >= 0) {
                        ::close(r->listen_fd);
                        r->listen_fd = -1;
                    }
                }
                return false;
            }
        }

        connection_handler_ = std::move(handler);
        multi_accept_enabled_ = true;
        return true;
    }

    // Submit an SQE to a specific ring; must be called from that ring's thread
    template<typename PrepFunc>
    bool submit_sqe(size_t ring_index, UringOperation* op, PrepFunc prep_func) {
        auto* worker_ring = rings_[ring_index % rings_.size()].get();
        io_uring_sqe* sqe = io_uring_get_sqe(&worker_ring->ring);
        if (!sqe) {
            return false;
        }
        prep_func(sqe);
        io_uring_sqe_set_data(sqe, op);
        io_uring_submit(&worker_ring->ring);
        return true;
    }

    void run() override {
        stopped_ = false;

        for (size_t i = 0; i < rings_.size(); ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    void stop() override {
        stopped_ = true;
        for (auto& ring : rings_) {
            ring->wake();
        }
    }

    bool stopped() const noexcept override {
        return stopped_;
    }

    void post(std::function<void()> callback) override {
        rings_[0]->post(std::move(callback));
    }

    void post_to(size_t ring_index, std::function<void()> callback) {
        rings_[ring_index % rings_.size()]->post(std::move(callback));
    }

private:
    Task<void> accept_loop(size_t ring_index);

    void worker_loop(size_t ring_index) {
        detail::set_current_dispatcher([this, ring_index](std::function<void()> fn) {
            post_to(ring_index, std::move(fn));
        });

        if (multi_accept_enabled_ && rings_[ring_index]->listen_fd >= 0) {
            accept_loop(ring_index).start_detached();
        }

        while (!stopped_) {
            poll_and_resume(ring_index);
            rings_[ring_index]->drain_callbacks();
        }

        detail::set_current_dispatcher(nullptr);
    }

    void poll_and_resume(size_t ring_index) {
        auto* worker_ring = rings_[ring_index].get();
        io_uring_cqe* cqe;

        __kernel_timespec ts;
        ts.tv_sec = 0;
        ts.tv_nsec = 1000;

        int ret = io_uring_wait_cqe_timeout(&worker_ring->ring, &cqe, &ts);
        if (ret < 0) {
            return;
        }

        unsigned head;
        unsigned processed = 0;
        io_uring_for_each_cqe(&worker_ring->ring, head, cqe) {
            auto* op = static_cast<UringOperation*>(io_uring_cqe_get_data(cqe));
            if (op) {
                op->result = cqe->res;
                if (cqe->res < 0) {
                    op->error = errno_error(-cqe->res);
                }
                if (op->continuation) {
                    op->continuation.resume();
                }
            }
            if (++processed >= 512) break;
        }
        io_uring_cq_advance(&worker_ring->ring, processed);
    }
};

// ============================================================================
// io_uring Listener
// ============================================================================

class UringListener : public Listener {
    UringContext& ctx_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;

public:
    explicit UringListener(UringContext& ctx) : ctx_(ctx) {}

    ~UringListener() override {
        close();
    }

    expected<void, Error> listen(uint16_t port, int backlog) override {
        listen_fd_ = open_listen_socket(port, backlog, false);
        if (listen_fd_ < 0) {
            return unexpected(errno_error(errno));
        }

        sockaddr_in bound_addr{};
        socklen_t addr_len = sizeof(bound_addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound_addr), &addr_len);
        port_ = ntohs(bound_addr.sin_port);
        return {};
    }

    Task<AcceptResult> async_accept() override;

    void close() override {
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
        }
    }

    bool is_listening() const noexcept override {
        return listen_fd_ >= 0;
    }

    uint16_t local_port() const noexcept override {
        return port_;
    }
};

// ============================================================================
// io_uring Connection
// ============================================================================

class UringConnection : public Connection {
    UringContext& ctx_;
    int fd_;
    size_t ring_index_;
    std::chrono::milliseconds timeout_{30000};
    CancellationToken cancel_token_;
    std::string remote_addr_;
    uint16_t remote_port_ = 0;

public:
    UringConnection(UringContext& ctx, int fd, const sockaddr_in& addr, size_t ring_index)
        : ctx_(ctx)
        , fd_(fd)
        , ring_index_(ring_index)
    {
        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        remote_addr_ = ip;
        remote_port_ = ntohs(addr.sin_port);
    }

    ~UringConnection() override {
        close();
    }

    Task<ReadResult> async_read(void* buffer, size_t len) override;
    Task<WriteResult> async_write(const void* buffer, size_t len) override;
    Task<WriteResult> async_write_all(const void* buffer, size_t len) override;
    Task<TransmitResult> async_transmit_file(FileHandle file, size_t offset, size_t length) override;

    void close() override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const noexcept override {
        return fd_ >= 0;
    }

    void set_timeout(std::chrono::milliseconds timeout) override {
        timeout_ = timeout;
    }

    std::string remote_address() const override {
        return remote_addr_;
    }

    uint16_t remote_port() const noexcept override {
        return remote_port_;
    }

    void set_cancellation_token(CancellationToken token) override {
        cancel_token_ = std::move(token);
    }

private:
    expected<void, Error> check_usable() const {
        if (!is_open()) {
            return unexpected(Error::io(IoError::ConnectionReset, "Connection closed"));
        }
        if (cancel_token_.is_cancelled()) {
            return unexpected(Error::cancelled());
        }
        return {};
    }

    // Waits until the socket accepts more data
    Task<expected<void, Error>> wait_writable();
};

// ============================================================================
// Async Operation Implementations
// ============================================================================

Task<AcceptResult> UringListener::async_accept() {
    if (!is_listening()) {
        co_return unexpected(Error::io(IoError::InvalidArgument, "Not listening"));
    }

    UringOperation op;
    int fd = listen_fd_;

    bool submitted = ctx_.submit_sqe(0, &op, [fd, &op](io_uring_sqe* sqe) {
        io_uring_prep_accept(sqe, fd,
                             reinterpret_cast<sockaddr*>(&op.client_addr),
                             &op.client_addr_len, 0);
    });

    if (!submitted) {
        co_return unexpected(Error::io(IoError::Unknown, "Failed to get SQE"));
    }

    co_await UringAwaiter{op};

    if (op.result < 0) {
        co_return unexpected(op.error);
    }

    set_tcp_opts(op.result);
    co_return AcceptResult(std::make_unique<UringConnection>(ctx_, op.result, op.client_addr, 0));
}

Task<ReadResult> UringConnection::async_read(void* buffer, size_t len) {
    if (auto usable = check_usable(); !usable) {
        co_return unexpected(usable.error());
    }

    UringOperation op;
    int fd = fd_;

    bool submitted = ctx_.submit_sqe(ring_index_, &op, [fd, buffer, len](io_uring_sqe* sqe) {
        io_uring_prep_recv(sqe, fd, buffer, len, 0);
    });

    if (!submitted) {
        co_return unexpected(Error::io(IoError::Unknown, "Failed to get SQE"));
    }

    co_await UringAwaiter{op};

    if (op.result < 0) {
        co_return unexpected(op.error);
    }

    if (op.result == 0) {
        co_return unexpected(Error::io(IoError::EndOfStream, "Connection closed by peer"));
    }

    co_return static_cast<size_t>(op.result);
}

Task<WriteResult> UringConnection::async_write(const void* buffer, size_t len) {
    if (auto usable = check_usable(); !usable) {
        co_return unexpected(usable.error());
    }

    UringOperation op;
    int fd = fd_;

    // MSG_NOSIGNAL: a peer that went away shows up as EPIPE, not SIGPIPE
    bool submitted = ctx_.submit_sqe(ring_index_, &op, [fd, buffer, len](io_uring_sqe* sqe) {
        io_uring_prep_send(sqe, fd, buffer, len, MSG_NOSIGNAL);
    });

    if (!submitted) {
        co_return unexpected(Error::io(IoError::Unknown, "Failed to get SQE"));
    }

    co_await UringAwaiter{op};

    if (op.result < 0) {
        co_return unexpected(op.error);
    }

    if (op.result == 0 && len > 0) {
        co_return unexpected(Error::io(IoError::ConnectionAborted, "Peer stopped reading"));
    }

    co_return static_cast<size_t>(op.result);
}

Task<WriteResult> UringConnection::async_write_all(const void* buffer, size_t len) {
    const char* buf = static_cast<const char*>(buffer);
    size_t total = 0;

    while (total < len) {
        auto result = co_await async_write(buf + total, len - total);
        if (!result) {
            co_return unexpected(result.error());
        }
        total += *result;
    }

    co_return total;
}

Task<expected<void, Error>> UringConnection::wait_writable() {
    UringOperation op;
    int fd = fd_;
    bool submitted = ctx_.submit_sqe(ring_index_, &op, [fd](io_uring_sqe* sqe) {
        io_uring_prep_poll_add(sqe, fd, POLLOUT);
    });
    if (!submitted) {
        co_return unexpected(Error::io(IoError::Unknown, "Failed to get SQE"));
    }
    co_await UringAwaiter{op};
    if (op.result < 0) {
        co_return unexpected(op.error);
    }
    co_return expected<void, Error>{};
}

Task<TransmitResult> UringConnection::async_transmit_file(FileHandle file, size_t offset, size_t length) {
    if (auto usable = check_usable(); !usable) {
        co_return unexpected(usable.error());
    }

    size_t total_sent = 0;
    off_t off = static_cast<off_t>(offset);

    while (total_sent < length) {
        ssize_t sent = sendfile(fd_, file, &off, length - total_sent);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                auto ready = co_await wait_writable();
                if (!ready) {
                    co_return unexpected(ready.error());
                }
                continue;
            }
            co_return unexpected(errno_error(errno));
        }
        if (sent == 0) {
            break; // EOF on source file
        }
        total_sent += static_cast<size_t>(sent);
    }

    co_return total_sent;
}

// ============================================================================
// Accept Loop (SO_REUSEPORT multi-accept)
// ============================================================================

Task<void> UringContext::accept_loop(size_t ring_index) {
    auto* worker_ring = rings_[ring_index].get();

    while (!stopped_ && worker_ring->listen_fd >= 0) {
        UringOperation op;
        int fd = worker_ring->listen_fd;

        bool submitted = submit_sqe(ring_index, &op, [fd, &op](io_uring_sqe* sqe) {
            io_uring_prep_accept(sqe, fd,
                                 reinterpret_cast<sockaddr*>(&op.client_addr),
                                 &op.client_addr_len, SOCK_NONBLOCK);
        });

        if (!submitted) {
            continue;
        }

        co_await UringAwaiter{op};

        if (stopped_) break;

        if (op.result < 0) {
            continue;
        }

        set_tcp_opts(op.result);
        auto conn = std::make_unique<UringConnection>(*this, op.result, op.client_addr, ring_index);

        if (connection_handler_) {
            connection_handler_(std::move(conn));
        } else {
            conn->close();
        }
    }
}

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IoContext> IoContext::create(size_t thread_count) {
    return std::make_unique<UringContext>(thread_count);
}

std::unique_ptr<Listener> Listener::create(IoContext& ctx) {
    return std::make_unique<UringListener>(static_cast<UringContext&>(ctx));
}

} // namespace streamgate::net

#endif // STREAMGATE_PLATFORM_LINUX
