#include <catch2/catch_test_macros.hpp>
#include "server/connection_tracker.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace handoff;

TEST_CASE("ConnectionTracker: accept and close balance out", "[tracker]") {
    ConnectionTracker tracker;
    tracker.on_accept();
    tracker.on_accept();
    CHECK(tracker.active_count() == 2);
    tracker.on_close();
    CHECK(tracker.active_count() == 1);
    tracker.on_close();
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("ConnectionTracker: unmatched close never goes negative", "[tracker]") {
    ConnectionTracker tracker;
    tracker.on_close();
    CHECK(tracker.active_count() == 0);

    tracker.on_accept();
    tracker.on_close();
    tracker.on_close();
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("ConnectionTracker: await_drained returns immediately at zero", "[tracker]") {
    ConnectionTracker tracker;
    auto start = std::chrono::steady_clock::now();
    CHECK(tracker.await_drained(std::chrono::seconds(5)) == DrainResult::Drained);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(100));
}

TEST_CASE("ConnectionTracker: await_drained blocks until the last close", "[tracker]") {
    ConnectionTracker tracker;
    tracker.on_accept();
    tracker.on_accept();

    std::atomic<bool> done{false};
    DrainResult result = DrainResult::DeadlineExceeded;
    std::thread waiter([&] {
        result = tracker.await_drained(std::chrono::seconds(5));
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    tracker.on_close();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK_FALSE(done.load());

    tracker.on_close();
    waiter.join();
    CHECK(result == DrainResult::Drained);
}

TEST_CASE("ConnectionTracker: deadline exceeded leaves count intact", "[tracker]") {
    ConnectionTracker tracker;
    tracker.on_accept();

    auto start = std::chrono::steady_clock::now();
    CHECK(tracker.await_drained(std::chrono::milliseconds(50)) == DrainResult::DeadlineExceeded);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed >= std::chrono::milliseconds(45));
    CHECK(elapsed < std::chrono::seconds(2));
    CHECK(tracker.active_count() == 1);
}

TEST_CASE("ConnectionTracker: concurrent accept/close settles at zero", "[tracker]") {
    ConnectionTracker tracker;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                tracker.on_accept();
                tracker.on_close();
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(tracker.active_count() == 0);
    CHECK(tracker.await_drained(std::chrono::milliseconds(10)) == DrainResult::Drained);
}
