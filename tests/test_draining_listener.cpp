#include <catch2/catch_test_macros.hpp>
#include "server/draining_listener.hpp"
#include "server/connection_tracker.hpp"
#include "server/http_server.hpp"
#include "core/one_shot_event.hpp"
#include "mocks/mock_task_queue.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <future>
#include <string>

using namespace handoff;
using namespace handoff::testing;

// ============================================================================
// TrackingTaskQueue
// ============================================================================

TEST_CASE("TrackingTaskQueue: enqueue counts and the finished task decrements", "[draining]") {
    ConnectionTracker tracker;
    MockTaskQueue workers;
    TrackingTaskQueue queue(workers, tracker);

    int ran = 0;
    CHECK(queue.enqueue([&] { ++ran; }));
    CHECK(queue.enqueue([&] { ++ran; }));
    CHECK(tracker.active_count() == 2);

    CHECK(workers.run_all() == 2);
    CHECK(ran == 2);
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("TrackingTaskQueue: refused task is not left counted", "[draining]") {
    ConnectionTracker tracker;
    MockTaskQueue workers;
    workers.set_refuse(true);
    TrackingTaskQueue queue(workers, tracker);

    CHECK_FALSE(queue.enqueue([] {}));
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("TrackingTaskQueue: task dropped unrun still decrements", "[draining]") {
    ConnectionTracker tracker;
    MockTaskQueue workers;
    TrackingTaskQueue queue(workers, tracker);

    bool ran = false;
    CHECK(queue.enqueue([&] { ran = true; }));
    CHECK(tracker.active_count() == 1);

    workers.drop_all();
    CHECK_FALSE(ran);
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("TrackingTaskQueue: shutdown leaves the worker pool running", "[draining]") {
    ConnectionTracker tracker;
    MockTaskQueue workers;
    TrackingTaskQueue queue(workers, tracker);

    CHECK(queue.enqueue([] {}));
    queue.shutdown();

    CHECK(workers.shutdown_calls() == 0);
    CHECK(workers.pending() == 1);
    CHECK(tracker.active_count() == 1);

    workers.run_all();
    CHECK(tracker.active_count() == 0);
}

// ============================================================================
// DrainingListener over a loopback server
// ============================================================================

namespace {

HttpServer::Config test_config() {
    HttpServer::Config cfg;
    cfg.read_timeout = std::chrono::seconds(3);
    cfg.write_timeout = std::chrono::seconds(3);
    cfg.worker_threads = 4;
    return cfg;
}

struct ListenerFixture {
    ConnectionTracker tracker;
    HttpServer server{test_config()};
    DrainingListener listener{server, tracker};

    ListenerFixture() {
        server.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
        server.bind("127.0.0.1", 0);
    }

    std::future<bool> start() {
        return std::async(std::launch::async, [this] { return listener.serve(); });
    }
};

} // namespace

TEST_CASE("DrainingListener: counts a socket from accept until the client leaves", "[draining]") {
    ListenerFixture f;
    auto serving = f.start();

    const int fd = connect_loopback(f.listener.port());
    REQUIRE(fd >= 0);
    REQUIRE(wait_until([&] { return f.tracker.active_count() == 1; }));

    ::close(fd);
    REQUIRE(wait_until([&] { return f.tracker.active_count() == 0; }));

    f.listener.close();
    REQUIRE(serving.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(serving.get());
}

TEST_CASE("DrainingListener: close before serve is not lost", "[draining]") {
    ListenerFixture f;
    f.listener.close();
    CHECK(f.listener.is_closed());
    CHECK(f.server.is_draining());

    auto serving = f.start();
    REQUIRE(serving.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(serving.get());
    CHECK(f.tracker.active_count() == 0);
}

TEST_CASE("DrainingListener: double close is benign", "[draining]") {
    ListenerFixture f;
    auto serving = f.start();

    f.listener.close();
    f.listener.close();
    REQUIRE(serving.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(serving.get());
}

TEST_CASE("DrainingListener: firing the armed signal stops intake", "[draining]") {
    ListenerFixture f;
    OneShotEvent signal;
    f.listener.arm_close_on(signal);
    auto serving = f.start();

    CHECK(serving.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);

    signal.fire();
    REQUIRE(serving.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(f.listener.is_closed());

    // Refused by the OS and never counted
    const int fd = connect_loopback(f.listener.port());
    CHECK(fd < 0);
    if (fd >= 0) ::close(fd);
    CHECK(f.tracker.active_count() == 0);
}

TEST_CASE("DrainingListener: connection accepted before close is still served", "[draining]") {
    ListenerFixture f;
    auto serving = f.start();

    const int fd = connect_loopback(f.listener.port());
    REQUIRE(fd >= 0);
    REQUIRE(send_all(fd, "GET / HTTP/1.1\r\nHost: x\r\n"));
    REQUIRE(wait_until([&] { return f.tracker.active_count() == 1; }));

    f.listener.close();
    REQUIRE(serving.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(f.tracker.active_count() == 1);

    REQUIRE(send_all(fd, "\r\n"));
    const std::string out = recv_until_close(fd);
    ::close(fd);

    CHECK(out.starts_with("HTTP/1.1 200 OK\r\n"));
    CHECK(out.ends_with("ok"));
    CHECK(f.tracker.await_drained(std::chrono::seconds(2)) == DrainResult::Drained);
}
