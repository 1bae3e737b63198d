#pragma once

#include <chrono>
#include <cstddef>

namespace handoff::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain; charset=utf-8";

inline constexpr std::chrono::seconds kDefaultReadTimeout{15};
inline constexpr std::chrono::seconds kDefaultWriteTimeout{15};
inline constexpr size_t kDefaultMaxBodyBytes = 32 << 20;    // 32 MiB
inline constexpr size_t kDefaultWorkerThreads = 16;

// The request-head limit is CPPHTTPLIB_HEADER_MAX_LENGTH (1 MiB), set by the build

} // namespace handoff::http
