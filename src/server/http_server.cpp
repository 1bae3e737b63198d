#include "server/http_server.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <exception>
#include <format>
#include <stdexcept>
#include <utility>

namespace handoff {

HttpServer::HttpServer() : HttpServer(Config{}) {}

HttpServer::HttpServer(const Config& config)
    : config_(config),
      svr_(std::make_unique<httplib::Server>()) {
    svr_->set_read_timeout(static_cast<time_t>(config_.read_timeout.count()), 0);
    svr_->set_write_timeout(static_cast<time_t>(config_.write_timeout.count()), 0);
    // An idle keep-alive connection is bounded by the same limit as a stalled read
    svr_->set_keep_alive_timeout(static_cast<time_t>(config_.read_timeout.count()));
    svr_->set_payload_max_length(config_.max_body_bytes);

    svr_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                   std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // Non-std exception: logged below with the generic text
        }
        utils::log::error(std::format("Handler for {} {} failed: {}", req.method, req.path, what));
        res.status = 500;
        res.set_content("Internal Server Error\n", http::kTextContentType);
    });

    svr_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            res.set_content("404 page not found\n", http::kTextContentType);
        }
    });
}

HttpServer::~HttpServer() = default;

HttpServer& HttpServer::Get(const std::string& pattern, Handler handler) {
    svr_->Get(pattern, std::move(handler));
    return *this;
}

HttpServer& HttpServer::Post(const std::string& pattern, Handler handler) {
    svr_->Post(pattern, std::move(handler));
    return *this;
}

uint16_t HttpServer::bind(const std::string& host, uint16_t port) {
    int bound = -1;
    if (port == 0) {
        bound = svr_->bind_to_any_port(host);
    } else if (svr_->bind_to_port(host, port)) {
        bound = port;
    }
    if (bound <= 0) {
        throw std::runtime_error(std::format("Could not listen on {}:{}", host, port));
    }

    port_ = static_cast<uint16_t>(bound);
    utils::log::info(std::format("Listening on {}:{}", host, port_));
    return port_;
}

void HttpServer::set_task_queue_factory(TaskQueueFactory factory) {
    task_queue_factory_ = std::move(factory);
}

bool HttpServer::serve() {
    if (port_ == 0) {
        throw std::runtime_error("HttpServer::serve() called before bind()");
    }

    // httplib asks for the queue once, right after it starts accepting
    svr_->new_task_queue = [this]() -> httplib::TaskQueue* {
        on_accept_loop_started();
        if (task_queue_factory_) {
            return task_queue_factory_();
        }
        return new httplib::ThreadPool(config_.worker_threads);
    };

    const bool ok = svr_->listen_after_bind();
    if (!ok) {
        utils::log::error(std::format("Accept loop on port {} failed", port_));
    }
    return ok;
}

void HttpServer::stop() {
    draining_.store(true, std::memory_order_release);

    std::lock_guard lock(stop_mutex_);
    stop_requested_ = true;
    if (accepting_ && !stop_issued_) {
        stop_issued_ = true;
        svr_->stop();
    }
}

void HttpServer::on_accept_loop_started() {
    std::lock_guard lock(stop_mutex_);
    accepting_ = true;
    if (stop_requested_ && !stop_issued_) {
        stop_issued_ = true;
        svr_->stop();
    }
}

} // namespace handoff
