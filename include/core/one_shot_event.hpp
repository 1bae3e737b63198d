#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace handoff {

/**
 * @brief Single-writer / multi-reader event that fires at most once
 *
 * Starts pending. The first fire() moves it to fired and wakes every
 * waiter; later fire() calls are no-ops and return false. Waiters that
 * arrive after the transition return immediately.
 */
class OneShotEvent {
public:
    OneShotEvent() = default;

    OneShotEvent(const OneShotEvent&) = delete;
    OneShotEvent& operator=(const OneShotEvent&) = delete;

    /// Returns true only for the call that performed the transition.
    bool fire();

    [[nodiscard]] bool is_fired() const;

    /// Blocks until fired.
    void wait();

    /// Blocks until fired or stop is requested. Returns true if fired.
    [[nodiscard]] bool wait(std::stop_token stop);

    /// Returns true if fired within the timeout.
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool fired_ = false;
};

} // namespace handoff
