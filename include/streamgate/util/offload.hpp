#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "streamgate/net/io_context.hpp"
#include "streamgate/util/worker_pool.hpp"

namespace streamgate {

// ============================================================================
// offload - Run blocking work off the event loop
// ============================================================================

// co_await offload(pool, fn) runs fn on a pool thread and resumes the awaiting
// coroutine through the dispatcher of the loop it was suspended on. Exceptions
// thrown by fn are rethrown at the co_await.
template<typename F>
class OffloadAwaiter {
    using Result = std::invoke_result_t<F&>;
    using Storage = std::conditional_t<std::is_void_v<Result>, bool, Result>;

    WorkerPool& pool_;
    F fn_;
    std::optional<Storage> result_;
    std::exception_ptr exception_;

public:
    OffloadAwaiter(WorkerPool& pool, F fn) : pool_(pool), fn_(std::move(fn)) {}

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> h) {
        pool_.post([this, h, dispatch = net::current_dispatcher()] {
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn_();
                    result_.emplace(true);
                } else {
                    result_.emplace(fn_());
                }
            } catch (...) {
                exception_ = std::current_exception();
            }
            dispatch([h] { h.resume(); });
        });
    }

    Result await_resume() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<Result>) {
            return std::move(*result_);
        }
    }
};

template<typename F>
OffloadAwaiter<std::decay_t<F>> offload(WorkerPool& pool, F&& fn) {
    return OffloadAwaiter<std::decay_t<F>>(pool, std::forward<F>(fn));
}

} // namespace streamgate
