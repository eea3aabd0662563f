#pragma once
#include "../types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Forward declaration to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace taskmcp {

/// Request/reply transport: each `POST /mcp` body is one request object and
/// the HTTP response body is its Response.
///
/// Unlike the line transports this one answers synchronously on the
/// connection thread, so it does not implement ITransport.
class HttpServerTransport {
public:
    using RequestHandler = std::function<Response(const nlohmann::json&)>;

    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 3000;   // 0 binds an ephemeral port
        std::string mcp_path = "/mcp";
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport();

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Bind and serve. Blocks until shutdown().
    void start(RequestHandler handler);
    void shutdown();
    [[nodiscard]] bool is_running() const;

    /// Block until the socket is bound (or start() failed).
    /// Returns the bound port, 0 on failure.
    uint16_t wait_until_bound();

    [[nodiscard]] uint16_t port() const { return bound_port_.load(); }

private:
    void setup_routes();

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    RequestHandler handler_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    std::mutex bind_mutex_;
    std::condition_variable bind_cv_;
    bool bind_settled_ = false;
};

} // namespace taskmcp
