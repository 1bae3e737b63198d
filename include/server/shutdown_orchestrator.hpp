#pragma once

#include "core/one_shot_event.hpp"
#include "core/types.hpp"
#include "server/draining_listener.hpp"
#include "watcher/artifact_watcher.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace handoff {

class ConnectionTracker;
class HttpServer;

/**
 * @brief Serving -> Draining -> Terminated, once per process
 *
 * run() starts the artifact watcher, arms the draining listener to close
 * when the watcher fires, and runs the HTTP accept loop. When the loop
 * returns (the listener was closed) it stops the watcher and waits for the
 * tracker to reach zero, bounded by the drain timeout.
 *
 * The return value is the process exit status:
 *   Drained     every connection closed in time
 *   Forced      the deadline elapsed; remaining connections are left for
 *               the OS to sever when the process exits
 *   FatalError  the watcher failed at runtime; the listener was closed and
 *               no drain wait is attempted. Open connections are left for
 *               the OS to sever, as with Forced
 */
class ShutdownOrchestrator {
public:
    struct Config {
        std::string watch_dir;
        std::chrono::milliseconds drain_timeout{30000};
    };

    /**
     * @param server Bound server with routes registered
     * @param tracker Shared connection counter
     */
    ShutdownOrchestrator(const Config& config, HttpServer& server, ConnectionTracker& tracker);

    ShutdownOrchestrator(const ShutdownOrchestrator&) = delete;
    ShutdownOrchestrator& operator=(const ShutdownOrchestrator&) = delete;

    /**
     * @brief Run the single pass; blocks until Terminated
     * @throws std::runtime_error if the watcher cannot be started, or if
     *         run() is called a second time
     */
    [[nodiscard]] ExitCode run();

    [[nodiscard]] OrchestratorState state() const {
        return state_.load(std::memory_order_acquire);
    }

    /// The artifact signal; firing it by hand has the same effect as a new artifact.
    [[nodiscard]] OneShotEvent& artifact_signal() { return artifact_signal_; }

    [[nodiscard]] uint16_t port() const { return listener_.port(); }

private:
    void on_watcher_error(const std::string& message);

    const Config config_;
    ConnectionTracker& tracker_;

    OneShotEvent artifact_signal_;
    DrainingListener listener_;
    ArtifactWatcher watcher_;

    std::atomic<OrchestratorState> state_{OrchestratorState::Starting};
    std::atomic<bool> started_{false};

    std::mutex error_mutex_;
    std::string fatal_error_;
};

} // namespace handoff
