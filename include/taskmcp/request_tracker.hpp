#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace taskmcp {

using Ticket = std::uint64_t;

struct PendingRequest {
    nlohmann::json id;
    std::chrono::steady_clock::time_point created_at;
};

/// Tracks requests that have been accepted but not yet answered.
///
/// Tickets are internal and unique, so callers may reuse correlation ids.
/// Whoever closes or expires a ticket first owns the right to respond.
class RequestTracker {
public:
    RequestTracker() = default;

    /// Register an accepted request and return its ticket.
    Ticket open(nlohmann::json id);

    /// Claim the ticket. Returns false if it was already closed or expired.
    bool close(Ticket ticket);

    /// Remove every ticket older than `timeout` and return their ids.
    std::vector<nlohmann::json> expire(std::chrono::milliseconds timeout);

    bool is_open(Ticket ticket) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<Ticket, PendingRequest> pending_;
    Ticket next_ticket_{1};
};

} // namespace taskmcp
