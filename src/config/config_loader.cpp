#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace handoff {

namespace {

// ============================================================================
// ${NAME} substitution
// ============================================================================

std::string expand_env_vars(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    size_t pos = 0;
    while (true) {
        const size_t open = in.find("${", pos);
        out.append(in.substr(pos, open - pos));
        if (open == std::string_view::npos) break;

        const size_t close = in.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(in.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

// Rewrites every string value in place, at any depth
void expand_in_place(toml::node& node) {
    if (auto* str = node.as_string()) {
        str->get() = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_in_place(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_in_place(child);
    }
}

// ============================================================================
// Typed extraction
// ============================================================================

using ConstView = toml::node_view<const toml::node>;

std::chrono::seconds seconds_or(ConstView view, std::chrono::seconds fallback) {
    return std::chrono::seconds(view.value_or(static_cast<int64_t>(fallback.count())));
}

void read_server(ConstView section, ServerConfig& out) {
    if (!section.is_table()) return;

    out.host = section["host"].value_or(out.host);
    // Read as int64 so "port = 70000" reaches validation instead of wrapping
    out.port = static_cast<int>(std::clamp<int64_t>(
        section["port"].value_or(int64_t{out.port}),
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
    out.read_timeout = seconds_or(section["read_timeout_seconds"], out.read_timeout);
    out.write_timeout = seconds_or(section["write_timeout_seconds"], out.write_timeout);
    out.threads = section["threads"].value_or(out.threads);
}

void read_shutdown(ConstView section, ShutdownConfig& out) {
    if (!section.is_table()) return;
    out.max_wait = seconds_or(section["max_wait_seconds"], out.max_wait);
}

HandoffConfig to_config(const toml::table& root) {
    HandoffConfig config;
    read_server(root["server"], config.server);
    read_shutdown(root["shutdown"], config.shutdown);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        toml::table root = toml::parse_file(config_path);
        expand_in_place(root);
        return validate_and_return(to_config(root));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        toml::table root = toml::parse(toml_content);
        expand_in_place(root);
        return validate_and_return(to_config(root));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const HandoffConfig& config) {
    std::vector<std::string> errors;
    const auto& server = config.server;

    if (server.host.empty()) {
        errors.emplace_back("server.host must not be empty");
    }
    if (!utils::in_range<1, 65535>(server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", server.port));
    }
    if (server.read_timeout <= std::chrono::seconds::zero()) {
        errors.push_back(std::format("server.read_timeout_seconds must be > 0, got {}",
                                     server.read_timeout.count()));
    }
    if (server.write_timeout <= std::chrono::seconds::zero()) {
        errors.push_back(std::format("server.write_timeout_seconds must be > 0, got {}",
                                     server.write_timeout.count()));
    }
    if (!utils::in_range<1, kMaxWorkerThreads>(server.threads)) {
        errors.push_back(std::format("server.threads must be 1-{}, got {}",
                                     kMaxWorkerThreads, server.threads));
    }
    if (!utils::in_range<0, kMaxWaitSecondsLimit>(config.shutdown.max_wait.count())) {
        errors.push_back(std::format("shutdown.max_wait_seconds must be 0-{}, got {}",
                                     kMaxWaitSecondsLimit, config.shutdown.max_wait.count()));
    }
    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(HandoffConfig config) {
    const auto errors = validate_config(config);
    if (errors.empty()) {
        return LoadResult::ok(std::move(config));
    }

    std::string message = "Config validation failed:";
    for (const auto& e : errors) {
        message += std::format("\n  - {}", e);
    }
    return LoadResult::error(std::move(message));
}

} // namespace handoff
