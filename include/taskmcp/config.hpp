#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace taskmcp {

constexpr const char* DEFAULT_API_BASE_URL = "https://task-master-pro-mikaelwestoo.replit.app/api";

/// Runtime settings for task_manager_server.
struct Config {
    std::string api_base_url = DEFAULT_API_BASE_URL;
    std::optional<std::string> api_key;

    bool use_http = false;
    std::string http_host = "127.0.0.1";
    uint16_t http_port = 3000;

    std::string log_level = "info";
    std::optional<std::string> log_file;

    std::chrono::milliseconds request_timeout{30000};
    int thread_pool_size = 4;

    bool show_help = false;
};

/// Looks up one environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the process environment.
std::optional<std::string> process_env(const std::string& name);

/// Environment first, then command-line flags (later wins).
/// Throws ConfigError on unknown flags, missing flag values or bad numbers.
Config load_config(int argc, const char* const* argv, const EnvLookup& env = process_env);

std::string usage_text(const std::string& program);

} // namespace taskmcp
