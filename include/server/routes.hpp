#pragma once

namespace handoff {

class HttpServer;
class ConnectionTracker;

namespace routes {

inline constexpr const char* kRootPath = "/";
inline constexpr const char* kHealthPath = "/healthz";

/**
 * @brief Register the built-in routes
 *
 * GET /        -> {"message": "Hello from handoffd!"}
 * GET /healthz -> {"status": "serving"|"draining", "active_connections": N, "pid": P}
 *
 * The handlers keep references to server and tracker, which must outlive
 * serving.
 */
void register_default_routes(HttpServer& server, const ConnectionTracker& tracker);

} // namespace routes
} // namespace handoff
