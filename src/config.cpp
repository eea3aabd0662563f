#include "taskmcp/config.hpp"
#include "taskmcp/error.hpp"
#include "taskmcp/logging.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <sstream>

namespace taskmcp {

namespace {

long long parse_integer(const std::string& what, const std::string& text,
                        long long min, long long max) {
    if (text.empty()) {
        throw ConfigError(what + " must be a number, got an empty value");
    }
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError(what + " must be a number, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError(what + " must be a number, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw ConfigError(what + " out of range: " + text);
    }
    return value;
}

uint16_t parse_port(const std::string& what, const std::string& text) {
    return static_cast<uint16_t>(parse_integer(what, text, 0, 65535));
}

std::chrono::milliseconds parse_timeout(const std::string& what, const std::string& text) {
    return std::chrono::milliseconds(
        parse_integer(what, text, 0, std::numeric_limits<int32_t>::max()));
}

} // anonymous namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

Config load_config(int argc, const char* const* argv, const EnvLookup& env) {
    Config cfg;

    if (auto v = env("TASK_MANAGER_API_BASE_URL"); v && !v->empty()) cfg.api_base_url = *v;
    if (auto v = env("TASK_MANAGER_API_KEY"); v && !v->empty()) cfg.api_key = *v;
    if (auto v = env("TASK_MANAGER_HTTP_PORT"); v && !v->empty()) {
        cfg.http_port = parse_port("TASK_MANAGER_HTTP_PORT", *v);
    }
    if (auto v = env("TASK_MANAGER_LOG_LEVEL"); v && !v->empty()) cfg.log_level = *v;
    if (auto v = env("TASK_MANAGER_LOG_FILE"); v && !v->empty()) cfg.log_file = *v;
    if (auto v = env("TASK_MANAGER_REQUEST_TIMEOUT_MS"); v && !v->empty()) {
        cfg.request_timeout = parse_timeout("TASK_MANAGER_REQUEST_TIMEOUT_MS", *v);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
        } else if (arg == "--http") {
            cfg.use_http = true;
        } else if (arg == "--host") {
            cfg.http_host = value();
        } else if (arg == "--port") {
            cfg.http_port = parse_port("--port", value());
        } else if (arg == "--api-base-url") {
            cfg.api_base_url = value();
        } else if (arg == "--api-key") {
            cfg.api_key = value();
        } else if (arg == "--log-level") {
            cfg.log_level = value();
        } else if (arg == "--log-file") {
            cfg.log_file = value();
        } else if (arg == "--timeout-ms") {
            cfg.request_timeout = parse_timeout("--timeout-ms", value());
        } else if (arg == "--threads") {
            cfg.thread_pool_size = static_cast<int>(parse_integer("--threads", value(), 1, 256));
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    // Reject a bad level here rather than at logger setup.
    parse_log_level(cfg.log_level);
    return cfg;
}

std::string usage_text(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Serves the task manager capabilities over stdio (default) or HTTP.\n"
        << "\n"
        << "Options:\n"
        << "  --http                 Serve POST /mcp instead of stdio\n"
        << "  --host <addr>          HTTP bind address (default 127.0.0.1)\n"
        << "  --port <n>             HTTP port (default 3000, env TASK_MANAGER_HTTP_PORT)\n"
        << "  --api-base-url <url>   Task store base URL (env TASK_MANAGER_API_BASE_URL)\n"
        << "  --api-key <key>        Task store API key (env TASK_MANAGER_API_KEY)\n"
        << "  --log-level <level>    trace|debug|info|warn|error|critical|off\n"
        << "                         (default info, env TASK_MANAGER_LOG_LEVEL)\n"
        << "  --log-file <path>      Also append logs to a file (env TASK_MANAGER_LOG_FILE)\n"
        << "  --timeout-ms <n>       Per-request deadline, 0 disables\n"
        << "                         (default 30000, env TASK_MANAGER_REQUEST_TIMEOUT_MS)\n"
        << "  --threads <n>          Initial worker threads, more start on demand (default 4)\n"
        << "  -h, --help             Show this help\n";
    return out.str();
}

} // namespace taskmcp
