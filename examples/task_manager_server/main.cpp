/// Task manager server: exposes the remote task store as resources, tools
/// and prompts.
/// Usage: ./task_manager_server [--http] [--port N] ... (see --help)
/// Speaks newline-delimited JSON on stdin/stdout unless --http is given.

#include <taskmcp/taskmcp.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>

int main(int argc, char* argv[]) {
    taskmcp::Config cfg;
    try {
        cfg = taskmcp::load_config(argc, argv);
    } catch (const taskmcp::ConfigError& e) {
        std::cerr << e.what() << "\n\n" << taskmcp::usage_text(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << taskmcp::usage_text(argv[0]);
        return 0;
    }

    try {
        taskmcp::LoggingOptions log_opts;
        log_opts.level = taskmcp::parse_log_level(cfg.log_level);
        log_opts.file = cfg.log_file;
        taskmcp::init_logging(log_opts);

        // A reader that goes away must not kill the process mid-write.
        std::signal(SIGPIPE, SIG_IGN);

        taskmcp::HttpApiClient::Options api_opts;
        api_opts.base_url = cfg.api_base_url;
        api_opts.api_key = cfg.api_key;
        taskmcp::HttpApiClient api{api_opts};
        if (!cfg.api_key) {
            spdlog::warn("TASK_MANAGER_API_KEY is not set; task store calls will fail");
        }

        taskmcp::Registry registry;
        taskmcp::register_task_capabilities(registry, api);

        taskmcp::Server::Options opts;
        opts.server_info = taskmcp::task_server_info();
        opts.thread_pool_size = cfg.thread_pool_size;
        opts.request_timeout = cfg.request_timeout;
        taskmcp::Server server{std::move(opts), registry};

        spdlog::info("Task manager server starting (API {})", cfg.api_base_url);
        if (cfg.use_http) {
            server.serve_http(cfg.http_host, cfg.http_port);
        } else {
            server.serve_stdio();
        }
        spdlog::info("Task manager server stopped");
    } catch (const taskmcp::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const taskmcp::TaskMcpError& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
