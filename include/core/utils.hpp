#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>

namespace handoff::utils {

// ============================================================================
// Range check that folds away bounds the type cannot reach
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    (void)value;  // Unused when both bounds fold away
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) < static_cast<Common>(Lo)) {
        if (static_cast<Common>(value) < static_cast<Common>(Lo)) return false;
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) > static_cast<Common>(Hi)) {
        if (static_cast<Common>(value) > static_cast<Common>(Hi)) return false;
    }
    return true;
}

// ============================================================================
// Integer parsing: the whole input must be consumed
// ============================================================================

template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T out{};
    const char* const last = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

// ============================================================================
// Logging (thread-safe, stderr)
//
//   HH:MM:SS.mmm [pid] [LEVEL] message
//
// The pid tells the outgoing process apart from its successor while both
// write to the same terminal or journal during a handoff.
// ============================================================================

namespace log {

enum class Level { INFO = 0, WARN = 1, ERROR = 2 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline const char* level_tag(Level level) {
        switch (level) {
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERROR: return "ERROR";
        }
        return "?????";
    }

    inline void write(Level level, std::string_view msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
        ::localtime_r(&secs, &local);
        char hms[16];
        std::strftime(hms, sizeof(hms), "%H:%M:%S", &local);

        const auto line = std::format("{}.{:03d} [{}] [{}] {}\n",
            hms, static_cast<int>(millis), ::getpid(), level_tag(level), msg);

        std::lock_guard lock(log_mutex());
        std::cerr << line;
    }
} // namespace detail

/// Messages below this level are dropped (tests raise it to keep output quiet)
inline void set_min_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

inline void info(std::string_view msg)  { detail::write(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::write(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::write(Level::ERROR, msg); }

} // namespace log

} // namespace handoff::utils
