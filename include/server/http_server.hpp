#pragma once

#include "server/http_constants.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
class Server;
class TaskQueue;
struct Request;
struct Response;
}

namespace handoff {

/**
 * @brief cpp-httplib server with a two-step start and a stop that is never lost
 *
 * bind() claims the port and serve() runs the accept loop on the calling
 * thread until stop(). A stop() that arrives before the accept loop has
 * started is remembered and applied as soon as it starts.
 *
 * After stop() the listening socket is closed: new clients are refused,
 * and each open connection is closed by httplib once the response in
 * flight has been written.
 */
class HttpServer {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;
    using TaskQueueFactory = std::function<httplib::TaskQueue*()>;

    struct Config {
        std::chrono::seconds read_timeout{http::kDefaultReadTimeout};
        std::chrono::seconds write_timeout{http::kDefaultWriteTimeout};
        size_t max_body_bytes = http::kDefaultMaxBodyBytes;
        size_t worker_threads = http::kDefaultWorkerThreads;
    };

    HttpServer();
    explicit HttpServer(const Config& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    HttpServer& Get(const std::string& pattern, Handler handler);
    HttpServer& Post(const std::string& pattern, Handler handler);

    /**
     * @brief Bind and listen on host:port; port 0 picks an ephemeral port
     * @return The bound port
     * @throws std::runtime_error if the address cannot be bound
     */
    uint16_t bind(const std::string& host, uint16_t port);

    /// Executor for accepted connections. Without one httplib's own pool is used.
    void set_task_queue_factory(TaskQueueFactory factory);

    /**
     * @brief Run the accept loop until stop() or an accept failure
     * @return false if the loop ended on an accept failure
     * @throws std::runtime_error if called before bind()
     */
    bool serve();

    /// Closes the listening socket. Idempotent and safe from any thread.
    void stop();

    [[nodiscard]] bool is_draining() const { return draining_.load(std::memory_order_acquire); }

    [[nodiscard]] uint16_t port() const { return port_; }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void on_accept_loop_started();

    const Config config_;
    std::unique_ptr<httplib::Server> svr_;
    TaskQueueFactory task_queue_factory_;
    uint16_t port_ = 0;

    std::atomic<bool> draining_{false};

    // httplib's stop() is a no-op until the accept loop runs
    std::mutex stop_mutex_;
    bool accepting_ = false;
    bool stop_requested_ = false;
    bool stop_issued_ = false;
};

} // namespace handoff
