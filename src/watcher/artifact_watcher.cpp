#include "watcher/artifact_watcher.hpp"
#include "core/one_shot_event.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <utility>
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace handoff {

namespace {

constexpr uint32_t kCreateMask = IN_CREATE | IN_MOVED_TO;
constexpr uint32_t kWatchGoneMask = IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED | IN_UNMOUNT;
constexpr int kPollIntervalMs = 100;

} // anonymous namespace

ArtifactWatcher::ArtifactWatcher(std::string watch_dir, OneShotEvent& signal)
    : watch_dir_(std::move(watch_dir)),
      signal_(signal) {}

ArtifactWatcher::~ArtifactWatcher() {
    stop();
}

void ArtifactWatcher::set_error_callback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void ArtifactWatcher::start() {
    if (running_.load()) return;

    const int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error(std::format("Could not create watcher: {}", strerror(errno)));
    }

    if (inotify_add_watch(fd, watch_dir_.c_str(), kCreateMask | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error(std::format("Could not watch {}: {}", watch_dir_, strerror(err)));
    }

    inotify_fd_ = fd;
    running_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Watching {} for new artifacts", watch_dir_));
}

void ArtifactWatcher::stop() {
    if (!running_.exchange(false)) return;
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    utils::log::info("Artifact watcher stopped");
}

void ArtifactWatcher::watch_loop(std::stop_token stop) {
    alignas(struct inotify_event) char buf[4096];

    while (!stop.stop_requested()) {
        struct pollfd pfd{};
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        // Short poll ticks keep stop() responsive
        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            report_error(std::format("poll() failed: {}", strerror(errno)));
            return;
        }
        if (rc == 0) continue;

        const ssize_t len = ::read(inotify_fd_, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            report_error(std::format("read() failed: {}", strerror(errno)));
            return;
        }

        for (const char* p = buf; p < buf + len; ) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(p);
            p += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                report_error("event queue overflowed, creation events may have been lost");
                return;
            }

            if (event->mask & kCreateMask) {
                const std::string name = event->len > 0 ? std::string(event->name) : std::string{};
                utils::log::info(std::format("New artifact found: {}. Preparing to shutdown.", name));
                signal_.fire();
                return;  // Fired; further artifacts are not our concern
            }

            if (event->mask & kWatchGoneMask) {
                report_error(std::format("watched directory {} is gone", watch_dir_));
                return;
            }
        }
    }
}

void ArtifactWatcher::report_error(const std::string& message) {
    const auto full = std::format("File watcher error occurred: {}", message);
    utils::log::error(full);
    if (error_callback_) {
        try {
            error_callback_(full);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Watcher error callback failed: {}", e.what()));
        }
    }
}

} // namespace handoff
