#include "config/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

namespace handoff {

namespace {

enum class FlagId { Port, MaxWait, Config, Help, Unknown };

struct FlagName {
    std::string_view spelling;
    FlagId id;
};

constexpr FlagName kFlags[] = {
    {"--port", FlagId::Port},
    {"-port", FlagId::Port},
    {"--max-wait", FlagId::MaxWait},
    {"-maxWait", FlagId::MaxWait},
    {"--config", FlagId::Config},
    {"-config", FlagId::Config},
    {"-h", FlagId::Help},
    {"--help", FlagId::Help},
    {"-help", FlagId::Help},
};

FlagId lookup_flag(std::string_view name) {
    for (const auto& f : kFlags) {
        if (f.spelling == name) return f.id;
    }
    return FlagId::Unknown;
}

// Canonical name for "Flag set:" lines
const char* canonical_name(FlagId id) {
    switch (id) {
        case FlagId::Port:    return "port";
        case FlagId::MaxWait: return "maxWait";
        case FlagId::Config:  return "config";
        default:              return "";
    }
}

CliParseResult fail(std::string message) {
    CliParseResult result;
    result.status = CliParseResult::Status::Error;
    result.error_message = std::move(message);
    return result;
}

} // anonymous namespace

CliParseResult parse_cli(int argc, const char* const argv[]) {
    CliParseResult result;
    auto& opts = result.options;
    std::vector<std::string> positionals;
    bool only_positionals = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (only_positionals || arg.size() < 2 || arg[0] != '-') {
            positionals.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positionals = true;
            continue;
        }

        std::string_view name = arg;
        std::optional<std::string_view> inline_value;
        if (const auto eq = arg.find('='); eq != std::string_view::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const FlagId id = lookup_flag(name);
        if (id == FlagId::Unknown) {
            return fail(std::format("flag provided but not defined: {}", name));
        }
        if (id == FlagId::Help) {
            result.status = CliParseResult::Status::Help;
            return result;
        }

        std::string_view value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            return fail(std::format("flag needs an argument: {}", name));
        }

        switch (id) {
            case FlagId::Port: {
                const auto port = utils::try_parse_int<int>(value);
                if (!port) {
                    return fail(std::format("invalid value \"{}\" for flag {}", value, name));
                }
                if (!utils::in_range<1, 65535>(*port)) {
                    return fail(std::format("invalid value \"{}\" for flag {}: port must be 1-65535",
                                            value, name));
                }
                opts.port = *port;
                break;
            }
            case FlagId::MaxWait: {
                const auto secs = utils::try_parse_int<int64_t>(value);
                if (!secs) {
                    return fail(std::format("invalid value \"{}\" for flag {}", value, name));
                }
                if (!utils::in_range<0, kMaxWaitSecondsLimit>(*secs)) {
                    return fail(std::format("invalid value \"{}\" for flag {}: seconds must be 0-{}",
                                            value, name, kMaxWaitSecondsLimit));
                }
                opts.max_wait = std::chrono::seconds(*secs);
                break;
            }
            case FlagId::Config:
                if (value.empty()) {
                    return fail(std::format("flag {} needs a file path", name));
                }
                opts.config_path = std::string(value);
                break;
            default:
                break;
        }
        opts.flags_set.emplace_back(canonical_name(id), std::string(value));
    }

    if (positionals.empty()) {
        return fail("missing directory to watch");
    }
    if (positionals.size() > 1) {
        return fail(std::format("expected one directory to watch, got {}", positionals.size()));
    }
    opts.watch_dir = std::move(positionals.front());
    return result;
}

std::string cli_usage(std::string_view program) {
    return std::format(
        "Usage: {} [options] <dir_to_watch>\n"
        "\n"
        "Serves HTTP until a new file appears in <dir_to_watch>, then stops\n"
        "accepting and waits for open connections to finish.\n"
        "\n"
        "Options:\n"
        "  --port N            TCP port to listen on (default 8000)\n"
        "  --max-wait SECONDS  Drain deadline after a new artifact (default 30, max 86400)\n"
        "  --config FILE       TOML config file; flags override its values\n"
        "  -h, --help          Show this help\n",
        program);
}

void apply_cli_overrides(HandoffConfig& config, const CliOptions& options) {
    if (options.port) config.server.port = *options.port;
    if (options.max_wait) config.shutdown.max_wait = *options.max_wait;
    config.watch_dir = options.watch_dir;
}

ConfigLoader::LoadResult load_effective_config(const CliOptions& options) {
    HandoffConfig config;
    if (!options.config_path.empty()) {
        utils::log::info(std::format("Loading configuration from {}", options.config_path));
        auto loaded = ConfigLoader::load_from_file(options.config_path);
        if (!loaded.success) {
            return loaded;
        }
        config = std::move(loaded.config);
    }
    apply_cli_overrides(config, options);
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // namespace handoff
