#pragma once

#include "config/config_loader.hpp"
#include "config/config_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace handoff {

// ============================================================================
// Command line
// ============================================================================

struct CliOptions {
    std::string watch_dir;
    std::string config_path;                        // Empty = no TOML file
    std::optional<int> port;
    std::optional<std::chrono::seconds> max_wait;

    // (name, value) for every flag given explicitly, in argv order
    std::vector<std::pair<std::string, std::string>> flags_set;
};

struct CliParseResult {
    enum class Status { Ok, Help, Error };

    Status status = Status::Ok;
    std::string error_message;
    CliOptions options;
};

/**
 * @brief Parse argv
 *
 *   handoffd [--port N] [--max-wait SECONDS] [--config FILE] <dir_to_watch>
 *
 * Accepts "--name value", "--name=value" and the single-dash spellings
 * -port and -maxWait. Exactly one positional argument is required.
 * Flag values are range-checked here, so a bad value is a usage error.
 */
[[nodiscard]] CliParseResult parse_cli(int argc, const char* const argv[]);

[[nodiscard]] std::string cli_usage(std::string_view program);

/**
 * @brief Layer CLI values over a loaded config (CLI wins)
 */
void apply_cli_overrides(HandoffConfig& config, const CliOptions& options);

/**
 * @brief Defaults, then the --config file if given, then the flags
 *
 * Fails only when the file cannot be loaded or holds invalid values; the
 * flags were already checked by parse_cli().
 */
[[nodiscard]] ConfigLoader::LoadResult load_effective_config(const CliOptions& options);

} // namespace handoff
