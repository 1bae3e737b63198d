#include "server/routes.hpp"
#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/connection_tracker.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <unistd.h>

namespace handoff::routes {

void register_default_routes(HttpServer& server, const ConnectionTracker& tracker) {
    server.Get(kRootPath, [](const httplib::Request&, httplib::Response& res) {
        const nlohmann::json body = {{"message", "Hello from handoffd!"}};
        res.status = 200;
        res.set_content(body.dump(), http::kJsonContentType);
    });

    server.Get(kHealthPath, [&server, &tracker](const httplib::Request&, httplib::Response& res) {
        const nlohmann::json body = {
            {"status", server.is_draining() ? "draining" : "serving"},
            {"active_connections", tracker.active_count()},
            {"pid", static_cast<int64_t>(::getpid())}
        };
        res.set_content(body.dump(), http::kJsonContentType);
    });
}

} // namespace handoff::routes
