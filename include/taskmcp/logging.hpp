#pragma once
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace taskmcp {

struct LoggingOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::optional<std::string> file;   // appended to, never truncated
};

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws ConfigError for anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

/// Install the default logger: a stderr console sink plus an optional file
/// sink. stdout is left alone because it carries the protocol.
void init_logging(const LoggingOptions& opts);

} // namespace taskmcp
