#pragma once

#include <httplib.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace handoff {

class ConnectionTracker;
class HttpServer;
class OneShotEvent;

/**
 * @brief httplib task queue that counts every accepted socket
 *
 * httplib enqueues one task per accepted socket, covering its whole
 * keep-alive lifetime. enqueue() registers the accept with the tracker and
 * hands the task to the worker pool wrapped in a TrackedConnection, which
 * reports the close once the task returns, or once it is dropped unrun if
 * the pool refuses it.
 *
 * The pool is borrowed: shutdown() leaves it running, so the accept loop
 * returns as soon as it stops instead of waiting for open connections.
 */
class TrackingTaskQueue : public httplib::TaskQueue {
public:
    TrackingTaskQueue(httplib::TaskQueue& workers, ConnectionTracker& tracker);

    bool enqueue(std::function<void()> fn) override;

    void shutdown() override {}

private:
    httplib::TaskQueue& workers_;
    ConnectionTracker& tracker_;
    std::atomic<uint64_t> next_id_{0};
};

/**
 * @brief Connection intake that can be shut off without touching accepted connections
 *
 * Installs a TrackingTaskQueue on the server and owns the worker pool
 * behind it. serve() runs the server's accept loop and returns once close()
 * has stopped it; connections already accepted keep being served by the
 * pool until they finish.
 *
 * arm_close_on() ties close() to a one-shot event.
 */
class DrainingListener {
public:
    DrainingListener(HttpServer& server, ConnectionTracker& tracker);

    /// Cancels the close waiter, then joins the pool (blocks on open connections).
    ~DrainingListener();

    DrainingListener(const DrainingListener&) = delete;
    DrainingListener& operator=(const DrainingListener&) = delete;

    /// Blocks in the accept loop. Returns false if it ended on an accept failure.
    bool serve();

    /// Stops the accept loop. Closing twice is a no-op.
    void close();

    /**
     * @brief Close once the event fires
     *
     * Spawns one background waiter. Calling it again is ignored. The waiter
     * is cancelled if this listener is destroyed before the event fires.
     */
    void arm_close_on(OneShotEvent& signal);

    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] uint16_t port() const;

private:
    HttpServer& server_;
    ConnectionTracker& tracker_;
    std::unique_ptr<httplib::ThreadPool> workers_;
    std::atomic<bool> closed_{false};
    std::jthread close_waiter_;
};

} // namespace handoff
