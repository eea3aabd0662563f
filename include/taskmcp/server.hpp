#pragma once
#include "types.hpp"
#include "registry.hpp"
#include "discovery.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace taskmcp {

/// Serves a Registry over a line transport or over HTTP.
///
/// Every decoded line becomes one task on a worker pool that grows whenever
/// all workers are busy, so neither the reader nor another request ever
/// waits on a stalled handler. Each accepted request yields exactly one
/// Response: its handler's, or a timeout error if the watchdog fires first.
class Server {
public:
    struct Options {
        ServerInfo server_info;
        /// Workers started up front; more are added on demand.
        int thread_pool_size = 4;
        /// Zero disables the per-request deadline.
        std::chrono::milliseconds request_timeout{30000};
    };

    /// The registry must outlive the server and must not change while serving.
    Server(Options opts, const Registry& registry);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Blocks until the transport reaches end of input or shutdown() is
    /// called, then finishes every in-flight request before returning.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void serve_http(const std::string& host, uint16_t port);
    void shutdown();

    bool is_running() const;

    /// Synchronous entry point shared by every transport.
    [[nodiscard]] Response handle(const nlohmann::json& message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace taskmcp
