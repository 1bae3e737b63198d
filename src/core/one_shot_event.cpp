#include "core/one_shot_event.hpp"

namespace handoff {

bool OneShotEvent::fire() {
    {
        std::lock_guard lock(mutex_);
        if (fired_) return false;
        fired_ = true;
    }
    cv_.notify_all();
    return true;
}

bool OneShotEvent::is_fired() const {
    std::lock_guard lock(mutex_);
    return fired_;
}

void OneShotEvent::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return fired_; });
}

bool OneShotEvent::wait(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    return cv_.wait(lock, stop, [this] { return fired_; });
}

bool OneShotEvent::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return fired_; });
}

} // namespace handoff
