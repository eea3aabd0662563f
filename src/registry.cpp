#include "taskmcp/registry.hpp"
#include <spdlog/spdlog.h>

namespace taskmcp {

std::string_view capability_kind_to_string(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Resource: return "resource";
        case CapabilityKind::Tool:     return "tool";
        case CapabilityKind::Prompt:   return "prompt";
    }
    return "unknown";
}

CapabilityKind capability_kind(const CapabilityEntry& entry) {
    if (std::holds_alternative<ResourceEntry>(entry)) return CapabilityKind::Resource;
    if (std::holds_alternative<ToolEntry>(entry)) return CapabilityKind::Tool;
    return CapabilityKind::Prompt;
}

const std::string& capability_name(const CapabilityEntry& entry) {
    return std::visit([](const auto& e) -> const std::string& { return e.name; }, entry);
}

void Registry::add_resource(ResourceEntry entry) {
    if (entry.schema.empty()) {
        for (auto& name : entry.uri_template.parameter_names()) {
            entry.schema.push_back(string_param(name, "Path parameter '" + name + "'", true));
        }
    }
    if (resources_.find(entry.name)) {
        spdlog::debug("Replacing resource '{}'", entry.name);
    }
    resources_.upsert(std::move(entry));
}

void Registry::add_tool(ToolEntry entry) {
    if (tools_.find(entry.name)) {
        spdlog::debug("Replacing tool '{}'", entry.name);
    }
    tools_.upsert(std::move(entry));
}

void Registry::add_prompt(PromptEntry entry) {
    if (prompts_.find(entry.name)) {
        spdlog::debug("Replacing prompt '{}'", entry.name);
    }
    prompts_.upsert(std::move(entry));
}

void Registry::add(CapabilityEntry entry) {
    if (auto* r = std::get_if<ResourceEntry>(&entry)) {
        add_resource(std::move(*r));
    } else if (auto* t = std::get_if<ToolEntry>(&entry)) {
        add_tool(std::move(*t));
    } else if (auto* p = std::get_if<PromptEntry>(&entry)) {
        add_prompt(std::move(*p));
    }
}

const ResourceEntry* Registry::find_resource(const std::string& name) const {
    return resources_.find(name);
}

const ToolEntry* Registry::find_tool(const std::string& name) const {
    return tools_.find(name);
}

const PromptEntry* Registry::find_prompt(const std::string& name) const {
    return prompts_.find(name);
}

std::optional<ResourceMatch> Registry::match_resource(const std::string& uri) const {
    for (const auto& entry : resources_.items()) {
        if (auto params = entry.uri_template.match(uri)) {
            return ResourceMatch{&entry, std::move(*params)};
        }
    }
    return std::nullopt;
}

std::optional<CapabilityEntry> Registry::lookup(CapabilityKind kind,
                                                const std::string& name) const {
    switch (kind) {
        case CapabilityKind::Resource:
            if (auto* e = resources_.find(name)) return CapabilityEntry{*e};
            break;
        case CapabilityKind::Tool:
            if (auto* e = tools_.find(name)) return CapabilityEntry{*e};
            break;
        case CapabilityKind::Prompt:
            if (auto* e = prompts_.find(name)) return CapabilityEntry{*e};
            break;
    }
    return std::nullopt;
}

std::vector<CapabilityEntry> Registry::all(CapabilityKind kind) const {
    std::vector<CapabilityEntry> out;
    switch (kind) {
        case CapabilityKind::Resource:
            out.assign(resources_.items().begin(), resources_.items().end());
            break;
        case CapabilityKind::Tool:
            out.assign(tools_.items().begin(), tools_.items().end());
            break;
        case CapabilityKind::Prompt:
            out.assign(prompts_.items().begin(), prompts_.items().end());
            break;
    }
    return out;
}

} // namespace taskmcp
