#include "config/cli_options.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "server/connection_tracker.hpp"
#include "server/http_server.hpp"
#include "server/routes.hpp"
#include "server/shutdown_orchestrator.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <utility>

using namespace handoff;

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "handoffd";

    // ---- Command line -------------------------------------------------------
    const auto cli = parse_cli(argc, argv);
    if (cli.status == CliParseResult::Status::Help) {
        std::fputs(cli_usage(program).c_str(), stdout);
        return to_int(ExitCode::Drained);
    }
    if (cli.status == CliParseResult::Status::Error) {
        std::fprintf(stderr, "%s\n%s", cli.error_message.c_str(), cli_usage(program).c_str());
        return to_int(ExitCode::Usage);
    }

    try {
        utils::log::info("handoffd starting...");

        // ---- Configuration: defaults < TOML file < flags --------------------
        auto loaded = load_effective_config(cli.options);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return to_int(ExitCode::FatalError);
        }
        const HandoffConfig config = std::move(loaded.config);
        for (const auto& [name, value] : cli.options.flags_set) {
            utils::log::info(std::format("Flag set: {}={}", name, value));
        }

        // ---- Server, routes ------------------------------------------------
        ConnectionTracker tracker;

        HttpServer::Config server_cfg;
        server_cfg.read_timeout = config.server.read_timeout;
        server_cfg.write_timeout = config.server.write_timeout;
        server_cfg.worker_threads = static_cast<size_t>(config.server.threads);
        HttpServer server(server_cfg);
        routes::register_default_routes(server, tracker);
        server.bind(config.server.host, static_cast<uint16_t>(config.server.port));

        // ---- Serve until a new artifact arrives, then drain -----------------
        ShutdownOrchestrator::Config orch_cfg;
        orch_cfg.watch_dir = config.watch_dir;
        orch_cfg.drain_timeout = config.shutdown.max_wait;
        ShutdownOrchestrator orchestrator(orch_cfg, server, tracker);

        const ExitCode code = orchestrator.run();
        utils::log::info(std::format("Exiting: {}", exit_code_to_string(code)));

        if (code != ExitCode::Drained) {
            // Workers may still be blocked on open clients; the OS severs their sockets
            std::fflush(stderr);
            std::_Exit(to_int(code));
        }
        return to_int(code);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return to_int(ExitCode::FatalError);
    }
}
