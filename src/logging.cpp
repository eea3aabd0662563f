#include "taskmcp/logging.hpp"
#include "taskmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace taskmcp {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw ConfigError("Unknown log level: " + name);
}

void init_logging(const LoggingOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (opts.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*opts.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file " + *opts.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("taskmcp", sinks.begin(), sinks.end());
    logger->set_level(opts.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace taskmcp
