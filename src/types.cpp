#include "taskmcp/types.hpp"
#include <chrono>
#include <stdexcept>

namespace taskmcp {

// ---------- RequestType ----------

std::string_view request_type_to_string(RequestType type) {
    switch (type) {
        case RequestType::Discover: return "discover";
        case RequestType::Resource: return "resource";
        case RequestType::Invoke:   return "invoke";
        case RequestType::Prompt:   return "prompt";
    }
    return "discover";
}

std::optional<RequestType> request_type_from_string(std::string_view s) {
    if (s == "discover") return RequestType::Discover;
    if (s == "resource") return RequestType::Resource;
    if (s == "invoke")   return RequestType::Invoke;
    if (s == "prompt")   return RequestType::Prompt;
    return std::nullopt;
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- JsonContent ----------

void to_json(nlohmann::json& j, const JsonContent& t) {
    j = {{"type", "json"}, {"json", t.json}};
}

void from_json(const nlohmann::json& j, JsonContent& t) {
    t.json = j.at("json");
}

// ---------- Content ----------

template <typename T, std::enable_if_t<std::is_same_v<T, Content>, int>>
void to_json(nlohmann::json& j, const T& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

template void to_json<Content>(nlohmann::json& j, const Content& c);

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "json") {
        c = j.get<JsonContent>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- ResourceContent ----------

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}, {"text", t.text}, {"metadata", t.metadata}};
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = j.at("uri").get<std::string>();
    t.text = j.at("text").get<std::string>();
    auto it = j.find("metadata");
    t.metadata = it == j.end() ? nlohmann::json::object() : *it;
}

// ---------- ResourceResult ----------

void to_json(nlohmann::json& j, const ResourceResult& t) {
    j = nlohmann::json::object();
    j["contents"] = nlohmann::json::array();
    for (const auto& c : t.contents) {
        j["contents"].push_back(c);
    }
}

void from_json(const nlohmann::json& j, ResourceResult& t) {
    t.contents = j.at("contents").get<std::vector<ResourceContent>>();
}

// ---------- ToolResult ----------

void to_json(nlohmann::json& j, const ToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
}

void from_json(const nlohmann::json& j, ToolResult& t) {
    t.content.clear();
    for (const auto& item : j.at("content")) {
        Content c;
        from_json(item, c);
        t.content.push_back(std::move(c));
    }
}

// ---------- PromptMessage ----------

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = {{"role", t.role}, {"content", nlohmann::json::array()}};
    for (const auto& c : t.content) {
        j["content"].push_back(c);
    }
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    t.role = j.at("role").get<std::string>();
    t.content = j.at("content").get<std::vector<TextContent>>();
}

// ---------- PromptResult ----------

void to_json(nlohmann::json& j, const PromptResult& t) {
    j = nlohmann::json::object();
    j["messages"] = nlohmann::json::array();
    for (const auto& m : t.messages) {
        j["messages"].push_back(m);
    }
}

void from_json(const nlohmann::json& j, PromptResult& t) {
    t.messages = j.at("messages").get<std::vector<PromptMessage>>();
}

// ---------- Response ----------

Response Response::success(nlohmann::json id, RequestType type, nlohmann::json payload) {
    Response r;
    r.id = std::move(id);
    r.type = std::string(request_type_to_string(type)) + "_response";
    r.payload = std::move(payload);
    return r;
}

Response Response::failure(nlohmann::json id, std::string message) {
    Response r;
    r.id = std::move(id);
    r.error = std::move(message);
    return r;
}

Response Response::decode_failure() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return failure("error_" + std::to_string(now),
                   "Failed to process request: invalid JSON");
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    if (r.error) {
        j["error"] = *r.error;
    } else {
        if (r.payload.is_object()) {
            for (const auto& [key, value] : r.payload.items()) {
                j[key] = value;
            }
        }
        if (r.type) j["type"] = *r.type;
    }
    // id last so a payload can never shadow it
    j["id"] = r.id;
}

void from_json(const nlohmann::json& j, Response& r) {
    auto id = j.find("id");
    r.id = id == j.end() ? nlohmann::json() : *id;
    r.type.reset();
    r.error.reset();
    r.payload = nlohmann::json::object();
    if (j.contains("error")) {
        r.error = j.at("error").get<std::string>();
        return;
    }
    for (const auto& [key, value] : j.items()) {
        if (key == "id") continue;
        if (key == "type") {
            r.type = value.get<std::string>();
            continue;
        }
        r.payload[key] = value;
    }
}

} // namespace taskmcp
