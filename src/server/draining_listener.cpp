#include "server/draining_listener.hpp"
#include "server/connection_tracker.hpp"
#include "server/http_server.hpp"
#include "server/tracked_connection.hpp"
#include "core/one_shot_event.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace handoff {

// ============================================================================
// TrackingTaskQueue
// ============================================================================

TrackingTaskQueue::TrackingTaskQueue(httplib::TaskQueue& workers, ConnectionTracker& tracker)
    : workers_(workers),
      tracker_(tracker) {}

bool TrackingTaskQueue::enqueue(std::function<void()> fn) {
    tracker_.on_accept();
    auto conn = std::make_shared<TrackedConnection>(
        tracker_, next_id_.fetch_add(1, std::memory_order_relaxed) + 1);
    utils::log::info(std::format("new connection #{}", conn->id()));

    // A refused task is destroyed unrun, and conn with it
    return workers_.enqueue([conn, task = std::move(fn)] {
        task();
        conn->close();
    });
}

// ============================================================================
// DrainingListener
// ============================================================================

DrainingListener::DrainingListener(HttpServer& server, ConnectionTracker& tracker)
    : server_(server),
      tracker_(tracker),
      workers_(std::make_unique<httplib::ThreadPool>(server.config().worker_threads)) {
    server_.set_task_queue_factory([this] {
        return new TrackingTaskQueue(*workers_, tracker_);
    });
}

DrainingListener::~DrainingListener() {
    // Cancel a waiter whose event never fired before the listener goes away
    if (close_waiter_.joinable()) {
        close_waiter_.request_stop();
        close_waiter_.join();
    }
    server_.set_task_queue_factory(nullptr);
    workers_->shutdown();
}

bool DrainingListener::serve() {
    return server_.serve();
}

void DrainingListener::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    server_.stop();
}

void DrainingListener::arm_close_on(OneShotEvent& signal) {
    if (close_waiter_.joinable()) return;

    close_waiter_ = std::jthread([this, &signal](std::stop_token stop) {
        if (!signal.wait(stop)) return;  // Cancelled
        utils::log::info("Stopping listening for new connections");
        close();
    });
}

uint16_t DrainingListener::port() const {
    return server_.port();
}

} // namespace handoff
