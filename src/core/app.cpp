#include "streamgate/core/app.hpp"
#include "streamgate/stream/response_writer.hpp"
#include "streamgate/util/zero_copy.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace streamgate {

namespace {

constexpr size_t MAX_REQUESTS_PER_CONNECTION = 100;
constexpr auto KEEP_ALIVE_TIMEOUT = std::chrono::seconds(30);
constexpr size_t MAX_HEADER_SIZE = 8192;
constexpr size_t MAX_BODY_SIZE = 1024 * 1024;
constexpr size_t READ_CHUNK_SIZE = 4096;

} // anonymous namespace

void App::run(uint16_t port) {
    io_ctx_ = net::IoContext::create(thread_count_);

    // SO_REUSEPORT listener per worker when available
    bool multi_accept = io_ctx_->enable_multi_accept(
        port, [this](std::unique_ptr<net::Connection> conn) {
            handle_connection(std::move(conn)).start_detached();
        });

    if (multi_accept) {
        auto entry = default_logger().entry(LogLevel::Info, "Server listening");
        entry.field("port", port);
        entry.field("threads", thread_count_);
        default_logger().log(entry);
    } else {
        listener_ = net::Listener::create(*io_ctx_);
        auto result = listener_->listen(port);
        if (!result) {
            throw std::runtime_error("Failed to listen: " + result.error().to_string());
        }
        auto entry = default_logger().entry(LogLevel::Info, "Server listening");
        entry.field("port", listener_->local_port());
        default_logger().log(entry);

        io_ctx_->post([this] { accept_loop().start_detached(); });
    }

    io_ctx_->run();
}

Task<void> App::accept_loop() {
    while (!cancel_source_.is_cancelled()) {
        auto conn_result = co_await listener_->async_accept();
        if (!conn_result) {
            if (cancel_source_.is_cancelled()) {
                break;
            }
            log_warn("Accept error: " + conn_result.error().to_string());
            continue;
        }
        handle_connection(std::move(*conn_result)).start_detached();
    }
}

void App::stop() {
    shutting_down_.store(true, std::memory_order_relaxed);
    cancel_source_.cancel();
    if (listener_) {
        listener_->close();
    }
    if (io_ctx_) {
        io_ctx_->stop();
    }
}

void App::shutdown(ShutdownOptions options) {
    log_info("Initiating graceful shutdown");
    shutting_down_.store(true, std::memory_order_relaxed);

    if (listener_) {
        listener_->close();
    }

    auto start = std::chrono::steady_clock::now();
    while (active_connections_.load(std::memory_order_relaxed) > 0) {
        if (std::chrono::steady_clock::now() - start >= options.drain_timeout) {
            log_warn("Drain timeout reached with " +
                     std::to_string(active_connections_.load(std::memory_order_relaxed)) +
                     " connections remaining");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (options.force_close_after_timeout &&
        active_connections_.load(std::memory_order_relaxed) > 0) {
        cancel_source_.cancel();
    }

    if (io_ctx_) {
        io_ctx_->stop();
    }
    log_info("Shutdown complete");
}

Task<Response> App::dispatch(Request& req) {
    auto match = router_.match(req.method(), req.path());
    if (match) {
        req.set_route_params(std::move(match.params));
    }

    std::string failure;
    try {
        co_return co_await middleware_chain_.execute_or_not_found(req, match.handler);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    auto entry = default_logger().entry(LogLevel::Error, "Handler threw");
    entry.field("path", req.path());
    entry.field("error", failure);
    default_logger().log(entry);
    co_return Response::error(500, "Internal server error");
}

Task<void> App::handle_connection(std::unique_ptr<net::Connection> conn) {
    active_connections_.fetch_add(1, std::memory_order_relaxed);

    struct ConnectionGuard {
        std::atomic<size_t>& counter;
        ~ConnectionGuard() { counter.fetch_sub(1, std::memory_order_relaxed); }
    } guard{active_connections_};

    conn->set_cancellation_token(cancel_source_.token());
    conn->set_timeout(KEEP_ALIVE_TIMEOUT);

    std::string pending;
    size_t request_count = 0;
    bool keep_alive = true;

    while (conn->is_open() && !cancel_source_.is_cancelled() && keep_alive) {
        ++request_count;

        auto req_result = co_await read_request(*conn, pending);
        if (!req_result) {
            const Error& err = req_result.error();
            if (err.is_cancelled() || err.is_timeout() || !err.is_http()) {
                break;
            }
            auto resp = Response::error(err.http_status(), err.message());
            resp.set_header("Connection", "close");
            auto data = resp.serialize();
            co_await conn->async_write_all(data.data(), data.size());
            break;
        }

        Request& req = *req_result;
        keep_alive = req.keep_alive() && request_count < MAX_REQUESTS_PER_CONNECTION &&
                     !is_shutting_down();

        // Stream routes frame their own response
        auto stream_match = router_.match_stream(req.method(), req.path());
        if (stream_match) {
            req.set_route_params(std::move(stream_match.params));
            stream::ConnectionResponseWriter writer(*conn, stream_headers_, keep_alive,
                                                   req.method() == HttpMethod::HEAD);

            std::string failure;
            try {
                co_await (*stream_match.handler)(req, writer);
            } catch (const std::exception& e) {
                failure = e.what();
            }

            if (!failure.empty()) {
                log_error("Stream handler threw: " + failure);
                if (!writer.committed()) {
                    co_await writer.send(Response::error(500, "Internal server error"));
                }
                writer.abort();
            }

            if (!writer.reusable()) {
                break;
            }
            continue;
        }

        Response resp = co_await dispatch(req);

        if (keep_alive) {
            resp.set_header("Connection", "keep-alive");
            resp.set_header("Keep-Alive", "timeout=30, max=" +
                            std::to_string(MAX_REQUESTS_PER_CONNECTION - request_count));
        } else {
            resp.set_header("Connection", "close");
        }

        if (resp.has_file() && req.method() != HttpMethod::HEAD) {
            auto headers_data = resp.serialize_headers();
            auto write_result = co_await conn->async_write_all(headers_data.data(), headers_data.size());
            if (!write_result) {
                break;
            }
            const auto& file_info = resp.file_info();
            auto transmit_result = co_await send_file_zero_copy(
                *conn, file_info.path, file_info.offset, file_info.length);
            if (!transmit_result || *transmit_result != file_info.length) {
                break;
            }
        } else {
            auto data = req.method() == HttpMethod::HEAD ? resp.serialize_headers() : resp.serialize();
            auto write_result = co_await conn->async_write_all(data.data(), data.size());
            if (!write_result) {
                break;
            }
        }
    }

    conn->close();
}

Task<expected<Request, Error>> App::read_request(net::Connection& conn, std::string& pending) {
    size_t header_end = pending.find("\r\n\r\n");

    while (header_end == std::string::npos) {
        if (pending.size() >= MAX_HEADER_SIZE) {
            co_return unexpected(Error::http(HttpError::PayloadTooLarge, "Headers too large"));
        }

        size_t old_size = pending.size();
        pending.resize(old_size + READ_CHUNK_SIZE);
        auto result = co_await conn.async_read(pending.data() + old_size, READ_CHUNK_SIZE);
        if (!result) {
            pending.resize(old_size);
            co_return unexpected(result.error());
        }
        pending.resize(old_size + *result);

        size_t search_from = old_size >= 3 ? old_size - 3 : 0;
        header_end = pending.find("\r\n\r\n", search_from);
    }

    auto parsed = parse_request_head(std::string_view(pending).substr(0, header_end + 2));
    if (!parsed) {
        co_return unexpected(parsed.error());
    }
    Request req = std::move(*parsed);
    size_t consumed = header_end + 4;

    size_t body_length = req.content_length().value_or(0);
    if (body_length > MAX_BODY_SIZE) {
        co_return unexpected(Error::http(HttpError::PayloadTooLarge, "Request body too large"));
    }

    if (body_length > 0) {
        std::string body = pending.substr(consumed, body_length);
        consumed += body.size();
        size_t have = body.size();
        body.resize(body_length);
        while (have < body_length) {
            auto result = co_await conn.async_read(body.data() + have, body_length - have);
            if (!result) {
                co_return unexpected(result.error());
            }
            have += *result;
        }
        req.set_body(std::move(body));
    }

    pending.erase(0, std::min(consumed, pending.size()));
    co_return req;
}

} // namespace streamgate
