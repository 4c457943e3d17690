#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace streamgate {

// ============================================================================
// WorkerPool - Fixed set of threads for blocking work
// ============================================================================

// Tasks run in FIFO order. Tasks must not throw. The destructor runs what is
// still queued, then joins.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(Task task);

    size_t size() const noexcept { return threads_.size(); }

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace streamgate
