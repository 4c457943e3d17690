#pragma once

#include <functional>
#include <vector>

#include "streamgate/core/request.hpp"
#include "streamgate/core/response.hpp"
#include "streamgate/core/router.hpp"
#include "streamgate/coro/task.hpp"

namespace streamgate {

// ============================================================================
// Middleware Types
// ============================================================================

// Continues to the next middleware, or the route handler
using Next = std::function<Task<Response>(Request&)>;

using Middleware = std::function<Task<Response>(Request&, Next)>;

// ============================================================================
// CompiledMiddlewareChain
// ============================================================================

// First added runs outermost. A missing handler answers 404 from the innermost
// position, so middleware still sees (and can decorate) not-found responses.
class CompiledMiddlewareChain {
    std::vector<Middleware> middleware_;

public:
    void add(Middleware mw) {
        middleware_.push_back(std::move(mw));
    }

    bool empty() const noexcept { return middleware_.empty(); }
    size_t size() const noexcept { return middleware_.size(); }

    Task<Response> execute_or_not_found(Request& req, const Handler* handler) const {
        return execute_at(0, req, handler);
    }

private:
    Task<Response> execute_at(size_t idx, Request& req, const Handler* handler) const {
        if (idx >= middleware_.size()) {
            if (handler) {
                co_return co_await (*handler)(req);
            }
            co_return Response::error(404, "Not found");
        }

        Next next = [this, idx, handler](Request& r) -> Task<Response> {
            return execute_at(idx + 1, r, handler);
        };
        co_return co_await middleware_[idx](req, next);
    }
};

} // namespace streamgate
