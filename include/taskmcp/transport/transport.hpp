#pragma once
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <functional>

namespace taskmcp {

/// Called once per decoded input line.
using MessageCallback = std::function<void(nlohmann::json)>;
/// Called with a ParseError for undecodable lines, or a TransportError on I/O failure.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract line transport
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue one response line. Safe to call from any thread.
    virtual void send(const Response& response) = 0;

    /// Stop reading and flush whatever has already been queued.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace taskmcp
