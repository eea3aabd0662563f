#pragma once
#include "types.hpp"
#include "schema.hpp"
#include "uri_template.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace taskmcp {

enum class CapabilityKind {
    Resource,
    Tool,
    Prompt
};

std::string_view capability_kind_to_string(CapabilityKind kind);

/// Handler types. Each runs on a worker thread and may block on the task store.
using ResourceHandler = std::function<ResourceResult(const std::string& uri,
                                                     const UriParams& params)>;
using ToolHandler = std::function<ToolResult(const nlohmann::json& parameters)>;
using PromptHandler = std::function<PromptResult(const nlohmann::json& parameters)>;

struct ResourceEntry {
    std::string name;
    std::string description;
    UriTemplate uri_template;
    Schema schema;      // filled from the template placeholders when left empty
    ResourceHandler handler;
};

struct ToolEntry {
    std::string name;
    std::string description;
    Schema schema;
    nlohmann::json usage = nlohmann::json::array();   // [{description, params}]
    ToolHandler handler;
};

struct PromptEntry {
    std::string name;
    std::string description;
    Schema schema;
    std::string usage;
    PromptHandler handler;
};

using CapabilityEntry = std::variant<ResourceEntry, ToolEntry, PromptEntry>;

CapabilityKind capability_kind(const CapabilityEntry& entry);
const std::string& capability_name(const CapabilityEntry& entry);

/// Name-keyed table that remembers registration order.
/// Re-adding a name replaces the entry in place.
template <typename T>
class OrderedTable {
public:
    void upsert(T entry) {
        auto it = index_.find(entry.name);
        if (it != index_.end()) {
            items_[it->second] = std::move(entry);
            return;
        }
        index_.emplace(entry.name, items_.size());
        items_.push_back(std::move(entry));
    }

    [[nodiscard]] const T* find(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) return nullptr;
        return &items_[it->second];
    }

    [[nodiscard]] const std::vector<T>& items() const noexcept { return items_; }
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

private:
    std::vector<T> items_;
    std::unordered_map<std::string, size_t> index_;
};

struct ResourceMatch {
    const ResourceEntry* entry = nullptr;
    UriParams params;
};

/// The three capability tables. Populate it before serving starts; lookups
/// during serving are read-only and take no lock.
class Registry {
public:
    void add_resource(ResourceEntry entry);
    void add_tool(ToolEntry entry);
    void add_prompt(PromptEntry entry);

    /// Store any kind of entry.
    void add(CapabilityEntry entry);

    [[nodiscard]] const ResourceEntry* find_resource(const std::string& name) const;
    [[nodiscard]] const ToolEntry* find_tool(const std::string& name) const;
    [[nodiscard]] const PromptEntry* find_prompt(const std::string& name) const;

    /// First resource (in registration order) whose template matches uri.
    [[nodiscard]] std::optional<ResourceMatch> match_resource(const std::string& uri) const;

    [[nodiscard]] std::optional<CapabilityEntry> lookup(CapabilityKind kind,
                                                        const std::string& name) const;

    /// Snapshot in registration order.
    [[nodiscard]] std::vector<CapabilityEntry> all(CapabilityKind kind) const;

    [[nodiscard]] const std::vector<ResourceEntry>& resources() const noexcept { return resources_.items(); }
    [[nodiscard]] const std::vector<ToolEntry>& tools() const noexcept { return tools_.items(); }
    [[nodiscard]] const std::vector<PromptEntry>& prompts() const noexcept { return prompts_.items(); }

private:
    OrderedTable<ResourceEntry> resources_;
    OrderedTable<ToolEntry> tools_;
    OrderedTable<PromptEntry> prompts_;
};

} // namespace taskmcp
