#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "streamgate/core/logging.hpp"
#include "streamgate/core/middleware.hpp"
#include "streamgate/core/request.hpp"
#include "streamgate/core/response.hpp"
#include "streamgate/core/router.hpp"
#include "streamgate/coro/cancellation.hpp"
#include "streamgate/coro/task.hpp"
#include "streamgate/net/io_context.hpp"

namespace streamgate {

struct ShutdownOptions {
    std::chrono::seconds drain_timeout{30};
    bool force_close_after_timeout = true;
};

// ============================================================================
// App - HTTP/1.1 server: routing, middleware and stream routes
// ============================================================================

class App {
    Router router_;
    std::unique_ptr<net::IoContext> io_ctx_;
    std::unique_ptr<net::Listener> listener_;
    CancellationSource cancel_source_;
    size_t thread_count_ = 1;
    CompiledMiddlewareChain middleware_chain_;

    // Stream routes skip the middleware chain; these go on every stream response
    Response::Headers stream_headers_;

    std::atomic<size_t> active_connections_{0};
    std::atomic<bool> shutting_down_{false};

public:
    App() = default;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    App& threads(size_t count) {
        thread_count_ = count;
        return *this;
    }

    App& route(HttpMethod method, std::string pattern, Handler handler) {
        router_.add(method, std::move(pattern), std::move(handler));
        return *this;
    }

    App& get(std::string pattern, Handler handler) {
        return route(HttpMethod::GET, std::move(pattern), std::move(handler));
    }

    App& post(std::string pattern, Handler handler) {
        return route(HttpMethod::POST, std::move(pattern), std::move(handler));
    }

    // Route with positional parameters converted to Args...
    template<typename... Args, typename F>
        requires std::invocable<F, Args..., Request&>
    App& get(std::string pattern, F&& handler) {
        router_.get<Args...>(std::move(pattern), std::forward<F>(handler));
        return *this;
    }

    // GET and HEAD; the handler owns the response framing
    App& stream(std::string pattern, StreamHandler handler) {
        router_.add_stream(std::move(pattern), std::move(handler));
        return *this;
    }

    App& stream_headers(Response::Headers headers) {
        stream_headers_ = std::move(headers);
        return *this;
    }

    // First registered runs outermost
    App& use(Middleware middleware) {
        middleware_chain_.add(std::move(middleware));
        return *this;
    }

    Router& router() noexcept { return router_; }

    // Routes one request through the middleware chain. Handler exceptions
    // become a 500 response.
    Task<Response> dispatch(Request& req);

    // Blocks until stop()
    void run(uint16_t port);

    void stop();

    // Stops accepting, waits for connections to drain, then stops the loop
    void shutdown(ShutdownOptions options = {});

    bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_relaxed);
    }

    size_t active_connections() const {
        return active_connections_.load(std::memory_order_relaxed);
    }

private:
    Task<void> handle_connection(std::unique_ptr<net::Connection> conn);

    // Reads one request; bytes past its end stay in `pending` for the next one
    Task<expected<Request, Error>> read_request(net::Connection& conn, std::string& pending);

    Task<void> accept_loop();
};

} // namespace streamgate
