#include <gtest/gtest.h>
#include "taskmcp/config.hpp"
#include "taskmcp/error.hpp"
#include <map>
#include <vector>

using namespace taskmcp;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

Config load(std::vector<const char*> args, std::map<std::string, std::string> vars = {}) {
    args.insert(args.begin(), "task_manager_server");
    return load_config(static_cast<int>(args.size()), args.data(), fake_env(std::move(vars)));
}

} // anonymous namespace

TEST(Config, Defaults) {
    auto cfg = load({});
    EXPECT_EQ(cfg.api_base_url, DEFAULT_API_BASE_URL);
    EXPECT_FALSE(cfg.api_key.has_value());
    EXPECT_FALSE(cfg.use_http);
    EXPECT_EQ(cfg.http_host, "127.0.0.1");
    EXPECT_EQ(cfg.http_port, 3000);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_FALSE(cfg.log_file.has_value());
    EXPECT_EQ(cfg.request_timeout.count(), 30000);
    EXPECT_EQ(cfg.thread_pool_size, 4);
    EXPECT_FALSE(cfg.show_help);
}

TEST(Config, ReadsEnvironment) {
    auto cfg = load({}, {
        {"TASK_MANAGER_API_BASE_URL", "http://localhost:9000/api"},
        {"TASK_MANAGER_API_KEY", "secret"},
        {"TASK_MANAGER_HTTP_PORT", "8080"},
        {"TASK_MANAGER_LOG_LEVEL", "debug"},
        {"TASK_MANAGER_LOG_FILE", "/tmp/tm.log"},
        {"TASK_MANAGER_REQUEST_TIMEOUT_MS", "500"},
    });
    EXPECT_EQ(cfg.api_base_url, "http://localhost:9000/api");
    EXPECT_EQ(cfg.api_key.value_or(""), "secret");
    EXPECT_EQ(cfg.http_port, 8080);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file.value_or(""), "/tmp/tm.log");
    EXPECT_EQ(cfg.request_timeout.count(), 500);
}

TEST(Config, EmptyEnvironmentValuesIgnored) {
    auto cfg = load({}, {{"TASK_MANAGER_API_KEY", ""}, {"TASK_MANAGER_HTTP_PORT", ""}});
    EXPECT_FALSE(cfg.api_key.has_value());
    EXPECT_EQ(cfg.http_port, 3000);
}

TEST(Config, FlagsOverrideEnvironment) {
    auto cfg = load({"--api-key", "from-flag", "--port", "4000"},
                    {{"TASK_MANAGER_API_KEY", "from-env"}, {"TASK_MANAGER_HTTP_PORT", "8080"}});
    EXPECT_EQ(cfg.api_key.value_or(""), "from-flag");
    EXPECT_EQ(cfg.http_port, 4000);
}

TEST(Config, AllFlags) {
    auto cfg = load({"--http", "--host", "0.0.0.0", "--port", "0",
                     "--api-base-url", "http://example.test",
                     "--log-level", "warning", "--log-file", "out.log",
                     "--timeout-ms", "0", "--threads", "8"});
    EXPECT_TRUE(cfg.use_http);
    EXPECT_EQ(cfg.http_host, "0.0.0.0");
    EXPECT_EQ(cfg.http_port, 0);
    EXPECT_EQ(cfg.api_base_url, "http://example.test");
    EXPECT_EQ(cfg.log_level, "warning");
    EXPECT_EQ(cfg.log_file.value_or(""), "out.log");
    EXPECT_EQ(cfg.request_timeout.count(), 0);
    EXPECT_EQ(cfg.thread_pool_size, 8);
}

TEST(Config, Help) {
    EXPECT_TRUE(load({"--help"}).show_help);
    EXPECT_TRUE(load({"-h"}).show_help);
}

TEST(Config, UnknownFlag) {
    EXPECT_THROW(load({"--verbose"}), ConfigError);
}

TEST(Config, MissingValue) {
    EXPECT_THROW(load({"--port"}), ConfigError);
}

TEST(Config, BadNumbers) {
    EXPECT_THROW(load({"--port", "abc"}), ConfigError);
    EXPECT_THROW(load({"--port", "70000"}), ConfigError);
    EXPECT_THROW(load({"--port", "80x"}), ConfigError);
    EXPECT_THROW(load({"--threads", "0"}), ConfigError);
    EXPECT_THROW(load({"--timeout-ms", "-1"}), ConfigError);
    EXPECT_THROW(load({}, {{"TASK_MANAGER_HTTP_PORT", "nope"}}), ConfigError);
}

TEST(Config, BadLogLevel) {
    EXPECT_THROW(load({"--log-level", "loud"}), ConfigError);
    EXPECT_THROW(load({}, {{"TASK_MANAGER_LOG_LEVEL", "chatty"}}), ConfigError);
}

TEST(Config, UsageMentionsFlags) {
    auto text = usage_text("tm");
    EXPECT_NE(text.find("Usage: tm"), std::string::npos);
    EXPECT_NE(text.find("--http"), std::string::npos);
    EXPECT_NE(text.find("--api-key"), std::string::npos);
}
