#include <catch2/catch_test_macros.hpp>

#include <slack_mcp/mcp/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using namespace slack_mcp;

TEST_CASE("WorkerPool: runs every submitted job", "[mcp][pool]") {
    std::atomic<int> done{0};
    WorkerPool pool(4);
    CHECK(pool.ThreadCount() == 4);

    for (int i = 0; i < 100; ++i) {
        pool.Submit([&done] { ++done; });
    }
    pool.Drain();
    CHECK(done == 100);
}

TEST_CASE("WorkerPool: jobs run on several threads", "[mcp][pool]") {
    std::mutex mutex;
    std::set<std::thread::id> seen;
    WorkerPool pool(3);

    for (int i = 0; i < 12; ++i) {
        pool.Submit([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(std::this_thread::get_id());
        });
    }
    pool.Drain();
    CHECK(seen.size() > 1);
    CHECK(seen.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("WorkerPool: Drain waits for running jobs", "[mcp][pool]") {
    std::atomic<bool> finished{false};
    WorkerPool pool(1);
    pool.Submit([&finished] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });
    pool.Drain();
    CHECK(finished);
}

TEST_CASE("WorkerPool: Drain on an idle pool returns", "[mcp][pool]") {
    WorkerPool pool(2);
    pool.Drain();
    pool.Drain();
    SUCCEED();
}

TEST_CASE("WorkerPool: destructor finishes queued work", "[mcp][pool]") {
    std::atomic<int> done{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 20; ++i) {
            pool.Submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            });
        }
    }
    CHECK(done == 20);
}
