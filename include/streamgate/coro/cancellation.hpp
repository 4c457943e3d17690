#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace streamgate {

class CancellationToken;
class CancellationSource;

namespace detail {

// Shared state between a source and its tokens
class CancellationState {
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<std::function<void()>> callbacks_;

public:
    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    bool cancel() {
        bool expected = false;
        if (!cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        std::vector<std::function<void()>> cbs;
        {
            std::lock_guard lock(mutex_);
            cbs = std::move(callbacks_);
        }
        for (auto& cb : cbs) {
            if (cb) cb();
        }
        return true;
    }

    // Runs the callback at once when cancellation already happened
    void register_callback(std::function<void()> cb) {
        {
            std::lock_guard lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                callbacks_.push_back(std::move(cb));
                return;
            }
        }
        if (cb) cb();
    }
};

} // namespace detail

// ============================================================================
// CancellationToken - Read-only view of cancellation state
// ============================================================================

class CancellationToken {
    std::shared_ptr<detail::CancellationState> state_;

    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

public:
    CancellationToken() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->is_cancelled();
    }

    bool valid() const noexcept {
        return state_ != nullptr;
    }

    void on_cancel(std::function<void()> callback) const {
        if (state_) {
            state_->register_callback(std::move(callback));
        }
    }

    static CancellationToken none() {
        return CancellationToken{};
    }
};

// ============================================================================
// CancellationSource - Controls cancellation
// ============================================================================

class CancellationSource {
    std::shared_ptr<detail::CancellationState> state_;

public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const {
        return CancellationToken{state_};
    }

    bool cancel() {
        return state_ && state_->cancel();
    }

    bool is_cancelled() const noexcept {
        return state_ && state_->is_cancelled();
    }
};

} // namespace streamgate
