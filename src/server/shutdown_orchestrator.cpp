#include "server/shutdown_orchestrator.hpp"
#include "server/connection_tracker.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace handoff {

ShutdownOrchestrator::ShutdownOrchestrator(const Config& config,
                                           HttpServer& server,
                                           ConnectionTracker& tracker)
    : config_(config),
      tracker_(tracker),
      listener_(server, tracker),
      watcher_(config.watch_dir, artifact_signal_) {
    watcher_.set_error_callback([this](const std::string& message) {
        on_watcher_error(message);
    });
}

ExitCode ShutdownOrchestrator::run() {
    if (started_.exchange(true)) {
        throw std::runtime_error("ShutdownOrchestrator::run() called twice");
    }

    utils::log::info("Starting watcher");
    watcher_.start();

    listener_.arm_close_on(artifact_signal_);

    state_.store(OrchestratorState::Serving, std::memory_order_release);
    const bool accept_ok = listener_.serve();

    // ---- Draining -----------------------------------------------------------
    state_.store(OrchestratorState::Draining, std::memory_order_release);

    utils::log::info("Stopping watching");
    watcher_.stop();

    std::string fatal_error;
    {
        std::lock_guard lock(error_mutex_);
        fatal_error = fatal_error_;
    }

    if (!fatal_error.empty()) {
        state_.store(OrchestratorState::Terminated, std::memory_order_release);
        utils::log::error(std::format("Terminating without drain: {}", fatal_error));
        return ExitCode::FatalError;
    }

    if (!accept_ok || !artifact_signal_.is_fired()) {
        utils::log::warn("Accept loop stopped without a new artifact; draining anyway");
    }

    const auto drain_seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(config_.drain_timeout).count();
    utils::log::info(std::format("Waiting for existing clients for up to {} seconds ({} open)",
                                 drain_seconds, tracker_.active_count()));

    const auto result = tracker_.await_drained(config_.drain_timeout);
    state_.store(OrchestratorState::Terminated, std::memory_order_release);

    if (result == DrainResult::DeadlineExceeded) {
        utils::log::warn(std::format("Maximum wait time exceeded with {} connections open. Terminating.",
                                     tracker_.active_count()));
        return ExitCode::Forced;
    }

    utils::log::info("All connections closed. Shutting down.");
    return ExitCode::Drained;
}

void ShutdownOrchestrator::on_watcher_error(const std::string& message) {
    {
        std::lock_guard lock(error_mutex_);
        if (!fatal_error_.empty()) return;
        fatal_error_ = message;
    }
    // Without the watcher the next build would never be noticed; stop serving
    listener_.close();
}

} // namespace handoff
