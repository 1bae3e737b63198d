#pragma once

#include "server/http_constants.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace handoff {

// Upper bounds accepted from the config file and the command line
inline constexpr int64_t kMaxWaitSecondsLimit = 24 * 60 * 60;
inline constexpr int64_t kMaxWorkerThreads = 1024;

// Signed fields so out-of-range input survives until validation

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::chrono::seconds read_timeout{http::kDefaultReadTimeout};
    std::chrono::seconds write_timeout{http::kDefaultWriteTimeout};
    int64_t threads = static_cast<int64_t>(http::kDefaultWorkerThreads);
};

struct ShutdownConfig {
    std::chrono::seconds max_wait{30};   // Drain deadline
};

struct HandoffConfig {
    ServerConfig server;
    ShutdownConfig shutdown;
    std::string watch_dir;               // Positional argument only
};

} // namespace handoff
