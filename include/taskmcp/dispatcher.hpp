#pragma once
#include "types.hpp"
#include "registry.hpp"
#include "discovery.hpp"
#include <variant>

namespace taskmcp {

/// Either a well-formed Request or the error Response that rejects it.
using ClassifyResult = std::variant<Request, Response>;

/// Turns one decoded request object into exactly one Response.
///
/// Per request: classify -> resolve -> invoke -> respond. Any exception
/// raised while resolving or invoking becomes an error Response carrying the
/// exception message, or "Unknown error" when it is not a std::exception.
class Dispatcher {
public:
    Dispatcher(const Registry& registry, ServerInfo info);

    [[nodiscard]] Response dispatch(const nlohmann::json& message) const;

    /// Validate the envelope and extract the typed fields.
    [[nodiscard]] static ClassifyResult classify(const nlohmann::json& message);

private:
    Response handle_resource(const Request& req) const;
    Response handle_invoke(const Request& req) const;
    Response handle_prompt(const Request& req) const;

    const Registry& registry_;
    DiscoveryAggregator discovery_;
};

} // namespace taskmcp
