#pragma once

#include <atomic>
#include <cstdint>

namespace handoff {

class ConnectionTracker;

/**
 * @brief Lifetime record of one accepted socket, reported to the tracker
 *
 * The socket's I/O runs inside httplib's per-connection task and is not
 * touched here. The first close() decrements the tracker; every later
 * close() is a no-op. The destructor closes if nobody else did, so a task
 * that is dropped without running still balances its accept.
 */
class TrackedConnection {
public:
    TrackedConnection(ConnectionTracker& tracker, uint64_t id);
    ~TrackedConnection();

    TrackedConnection(const TrackedConnection&) = delete;
    TrackedConnection& operator=(const TrackedConnection&) = delete;

    /// Returns true only for the call that decremented the tracker.
    bool close();

    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] uint64_t id() const { return id_; }

private:
    ConnectionTracker& tracker_;
    const uint64_t id_;
    std::atomic<bool> closed_{false};
};

} // namespace handoff
