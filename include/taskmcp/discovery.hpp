#pragma once
#include "registry.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace taskmcp {

/// Server-level metadata reported alongside the capability lists.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string description;
    std::string publisher;
    nlohmann::json examples = nlohmann::json::array();   // [{description, tool, parameters}]
};

/// Builds the discovery manifest:
///   {name, version, description, publisher, tools, resources, prompts, examples}
/// Entry order follows registration order within each kind. Output depends only
/// on the registry contents at call time.
class DiscoveryAggregator {
public:
    DiscoveryAggregator(const Registry& registry, ServerInfo info);

    [[nodiscard]] nlohmann::json build_manifest() const;

    [[nodiscard]] static nlohmann::json describe(const ToolEntry& tool);
    [[nodiscard]] static nlohmann::json describe(const ResourceEntry& resource);
    [[nodiscard]] static nlohmann::json describe(const PromptEntry& prompt);

    [[nodiscard]] const ServerInfo& server_info() const noexcept { return info_; }

private:
    const Registry& registry_;
    ServerInfo info_;
};

} // namespace taskmcp
