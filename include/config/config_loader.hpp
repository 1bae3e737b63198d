#pragma once

#include "config/config_types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace handoff {

// ============================================================================
// ConfigLoader - Extract typed config from a TOML file
// ============================================================================

/**
 * @brief Loads handoffd.toml
 *
 * Recognized keys (all optional; unset keys keep their defaults):
 *
 *   [server]
 *   host = "0.0.0.0"
 *   port = 8000
 *   read_timeout_seconds = 15
 *   write_timeout_seconds = 15
 *   threads = 16                 # connection worker pool
 *
 *   [shutdown]
 *   max_wait_seconds = 30        # 0 to 86400
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        HandoffConfig config;

        static LoadResult ok(HandoffConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to handoffd.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges; returns one message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const HandoffConfig& config);

private:
    static LoadResult validate_and_return(HandoffConfig config);
};

} // namespace handoff
