#include <catch2/catch_test_macros.hpp>
#include <streamgate/util/offload.hpp>
#include <streamgate/util/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace streamgate;
using namespace std::chrono_literals;

TEST_CASE("Pool size", "[worker_pool]") {
    CHECK(WorkerPool(3).size() == 3);
    CHECK(WorkerPool(0).size() == 1);
}

TEST_CASE("Concurrency never exceeds the thread count", "[worker_pool]") {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 8; ++i) {
            pool.post([&] {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(10ms);
                --running;
                ++done;
            });
        }
    }
    CHECK(done == 8);
    CHECK(peak <= 2);
}

TEST_CASE("Queued tasks run before the destructor returns", "[worker_pool]") {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        pool.post([] { std::this_thread::sleep_for(20ms); });
        for (int i = 0; i < 50; ++i) {
            pool.post([&] { ++done; });
        }
    }
    CHECK(done == 50);
}

namespace {

Task<int> offloaded_answer(WorkerPool& pool, std::thread::id& ran_on) {
    int value = co_await offload(pool, [&ran_on] {
        ran_on = std::this_thread::get_id();
        return 42;
    });
    co_return value;
}

Task<int> offloaded_failure(WorkerPool& pool) {
    co_await offload(pool, [] { throw std::runtime_error("disk gone"); });
    co_return 0;
}

} // namespace

TEST_CASE("offload runs on the pool and resumes with the result", "[worker_pool][offload]") {
    WorkerPool pool(1);

    SECTION("Value") {
        std::thread::id ran_on;
        CHECK(offloaded_answer(pool, ran_on).sync_wait() == 42);
        CHECK(ran_on != std::thread::id());
        CHECK(ran_on != std::this_thread::get_id());
    }

    SECTION("Exceptions reach the awaiter") {
        CHECK_THROWS_AS(offloaded_failure(pool).sync_wait(), std::runtime_error);
    }
}
