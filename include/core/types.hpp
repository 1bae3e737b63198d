#pragma once

#include <cstdint>

namespace handoff {

// ============================================================================
// Process exit status
// ============================================================================

enum class ExitCode : int {
    Drained = 0,       // All connections closed before the deadline
    FatalError = 1,    // Bind / watcher init / watcher runtime failure, bad config
    Usage = 2,         // Missing watch directory, unknown flag or bad flag value
    Forced = 3         // Drain deadline elapsed with connections still open
};

inline constexpr int to_int(ExitCode code) { return static_cast<int>(code); }

inline constexpr const char* exit_code_to_string(ExitCode code) {
    switch (code) {
        case ExitCode::Drained:    return "drained";
        case ExitCode::FatalError: return "fatal_error";
        case ExitCode::Usage:      return "usage";
        case ExitCode::Forced:     return "forced";
    }
    return "unknown";
}

// ============================================================================
// Drain outcome
// ============================================================================

enum class DrainResult : uint8_t {
    Drained,
    DeadlineExceeded
};

// ============================================================================
// Orchestrator lifecycle
// ============================================================================

enum class OrchestratorState : uint8_t {
    Starting,
    Serving,
    Draining,
    Terminated
};

inline constexpr const char* state_to_string(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Starting:   return "starting";
        case OrchestratorState::Serving:    return "serving";
        case OrchestratorState::Draining:   return "draining";
        case OrchestratorState::Terminated: return "terminated";
    }
    return "unknown";
}

} // namespace handoff
