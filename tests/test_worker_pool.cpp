#include <quarry/runtime/worker_pool.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using quarry::runtime::WorkerPool;

TEST_CASE("Worker pool runs submitted tasks") {
    WorkerPool pool(3);
    REQUIRE(pool.size() == 3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        REQUIRE(results[static_cast<std::size_t>(i)].get() == i * i);
    }
}

TEST_CASE("Worker pool always has at least one thread") {
    WorkerPool pool(0);
    REQUIRE(pool.size() == 1);
    REQUIRE(pool.submit([] { return 7; }).get() == 7);
}

TEST_CASE("Exceptions reach the future") {
    WorkerPool pool(1);
    auto failed = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failed.get(), std::runtime_error);
    REQUIRE(pool.submit([] { return 1; }).get() == 1);
}

TEST_CASE("Destruction drains tasks nobody waits for") {
    std::atomic<int> finished{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 8; ++i) {
            (void)pool.submit([&finished] {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                finished.fetch_add(1);
            });
        }
    }
    REQUIRE(finished.load() == 8);
}
