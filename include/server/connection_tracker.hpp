#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace handoff {

/**
 * @brief Counts connections accepted by the server and not yet closed
 *
 * Created once in main() and passed by reference to the draining listener
 * and every tracked connection. on_close() may be called from any
 * connection thread; await_drained() is called once by the orchestrator.
 */
class ConnectionTracker {
public:
    ConnectionTracker() = default;

    ConnectionTracker(const ConnectionTracker&) = delete;
    ConnectionTracker& operator=(const ConnectionTracker&) = delete;

    /// Called once per accepted connection.
    void on_accept();

    /// Called once per connection when it is closed. A close with no
    /// matching accept is refused so the counter never goes negative.
    void on_close();

    /// Blocks until the count reaches zero or the deadline elapses.
    /// Returns immediately with Drained if the count is already zero.
    [[nodiscard]] DrainResult await_drained(std::chrono::milliseconds deadline);

    [[nodiscard]] uint32_t active_count() const {
        return active_.load(std::memory_order_acquire);
    }

private:
    std::atomic<uint32_t> active_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace handoff
