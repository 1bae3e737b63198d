#include "server/connection_tracker.hpp"
#include "core/utils.hpp"

namespace handoff {

void ConnectionTracker::on_accept() {
    active_.fetch_add(1, std::memory_order_acq_rel);
}

void ConnectionTracker::on_close() {
    uint32_t current = active_.load(std::memory_order_acquire);
    do {
        if (current == 0) {
            utils::log::error("Connection tracker: close without matching accept ignored");
            return;
        }
    } while (!active_.compare_exchange_weak(current, current - 1,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire));

    if (current == 1) {
        // Lock before notifying so a waiter between its predicate check
        // and the wait cannot miss the wakeup.
        { std::lock_guard lock(drain_mutex_); }
        drain_cv_.notify_all();
    }
}

DrainResult ConnectionTracker::await_drained(std::chrono::milliseconds deadline) {
    std::unique_lock lock(drain_mutex_);
    const bool drained = drain_cv_.wait_for(lock, deadline, [this] {
        return active_.load(std::memory_order_acquire) == 0;
    });
    return drained ? DrainResult::Drained : DrainResult::DeadlineExceeded;
}

} // namespace handoff
