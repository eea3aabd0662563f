#include "taskmcp/discovery.hpp"

namespace taskmcp {

namespace {

nlohmann::json describe_parameters(const Schema& schema) {
    nlohmann::json params = nlohmann::json::array();
    for (const auto& spec : schema) {
        params.push_back(spec);
    }
    return params;
}

std::string or_default(const std::string& value, const std::string& prefix,
                       const std::string& name) {
    return value.empty() ? prefix + name : value;
}

} // anonymous namespace

DiscoveryAggregator::DiscoveryAggregator(const Registry& registry, ServerInfo info)
    : registry_(registry), info_(std::move(info)) {}

nlohmann::json DiscoveryAggregator::describe(const ToolEntry& tool) {
    return {
        {"name", tool.name},
        {"description", or_default(tool.description, "Tool: ", tool.name)},
        {"parameters", describe_parameters(tool.schema)},
        {"usage", tool.usage.is_null() ? nlohmann::json::array() : tool.usage}
    };
}

nlohmann::json DiscoveryAggregator::describe(const ResourceEntry& resource) {
    return {
        {"name", resource.name},
        {"description", or_default(resource.description, "Resource: ", resource.name)},
        {"uriTemplate", resource.uri_template.pattern()},
        {"parameters", describe_parameters(resource.schema)}
    };
}

nlohmann::json DiscoveryAggregator::describe(const PromptEntry& prompt) {
    return {
        {"name", prompt.name},
        {"description", or_default(prompt.description, "Prompt: ", prompt.name)},
        {"parameters", describe_parameters(prompt.schema)},
        {"usage", prompt.usage}
    };
}

nlohmann::json DiscoveryAggregator::build_manifest() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& t : registry_.tools()) tools.push_back(describe(t));

    nlohmann::json resources = nlohmann::json::array();
    for (const auto& r : registry_.resources()) resources.push_back(describe(r));

    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& p : registry_.prompts()) prompts.push_back(describe(p));

    nlohmann::json manifest = {
        {"tools", std::move(tools)},
        {"resources", std::move(resources)},
        {"prompts", std::move(prompts)},
        {"examples", info_.examples.is_array() ? info_.examples : nlohmann::json::array()}
    };
    if (!info_.name.empty()) manifest["name"] = info_.name;
    if (!info_.version.empty()) manifest["version"] = info_.version;
    if (!info_.description.empty()) manifest["description"] = info_.description;
    if (!info_.publisher.empty()) manifest["publisher"] = info_.publisher;
    return manifest;
}

} // namespace taskmcp
