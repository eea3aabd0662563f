#include "taskmcp/request_tracker.hpp"

namespace taskmcp {

Ticket RequestTracker::open(nlohmann::json id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Ticket ticket = next_ticket_++;
    PendingRequest req;
    req.id = std::move(id);
    req.created_at = std::chrono::steady_clock::now();
    pending_.emplace(ticket, std::move(req));
    return ticket;
}

bool RequestTracker::close(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(ticket) > 0;
}

std::vector<nlohmann::json> RequestTracker::expire(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    std::vector<nlohmann::json> timed_out;

    // Tickets are issued in increasing order, so the map is ordered by age.
    for (auto it = pending_.begin(); it != pending_.end(); ) {
        if (now - it->second.created_at >= timeout) {
            timed_out.push_back(std::move(it->second.id));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    return timed_out;
}

bool RequestTracker::is_open(Ticket ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(ticket) > 0;
}

size_t RequestTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace taskmcp
