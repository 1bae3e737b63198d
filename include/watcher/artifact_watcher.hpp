#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace handoff {

class OneShotEvent;

/**
 * @brief Fires a one-shot event when a new file appears in a directory
 *
 * Uses Linux inotify on a single directory. IN_CREATE and IN_MOVED_TO both
 * count as creation (a build dropped in via rename is still a new
 * artifact); deletes, writes and attribute changes are ignored. File names
 * are not inspected.
 *
 * States: watching -> fired. On the first creation event the watcher fires
 * the event and stops observing; later events are never read.
 *
 * An inotify failure after start (read/poll error, queue overflow, or the
 * watched directory disappearing) is unrecoverable: the error callback is
 * invoked once on the watcher thread and observation stops. Without the
 * watcher there is no way to learn about the next build, so callers treat
 * it as fatal.
 *
 * stop() releases the inotify descriptor and joins the thread whether or
 * not the event ever fired.
 */
class ArtifactWatcher {
public:
    using ErrorCallback = std::function<void(const std::string& message)>;

    /**
     * @param watch_dir Directory to observe
     * @param signal Event fired on the first creation; must outlive the watcher
     */
    ArtifactWatcher(std::string watch_dir, OneShotEvent& signal);

    ~ArtifactWatcher();

    // Non-copyable, non-movable
    ArtifactWatcher(const ArtifactWatcher&) = delete;
    ArtifactWatcher& operator=(const ArtifactWatcher&) = delete;

    /**
     * @brief Set the callback invoked on an unrecoverable inotify error
     */
    void set_error_callback(ErrorCallback callback);

    /**
     * @brief Initialize inotify, add the watch, spawn the observation thread
     * @throws std::runtime_error if inotify cannot be initialized or the
     *         directory cannot be watched
     */
    void start();

    /**
     * @brief Stop observing and release inotify resources (idempotent)
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    [[nodiscard]] const std::string& watch_dir() const { return watch_dir_; }

private:
    void watch_loop(std::stop_token stop);
    void report_error(const std::string& message);

    std::string watch_dir_;
    OneShotEvent& signal_;
    ErrorCallback error_callback_;

    int inotify_fd_ = -1;
    std::atomic<bool> running_{false};
    std::jthread watch_thread_;
};

} // namespace handoff
