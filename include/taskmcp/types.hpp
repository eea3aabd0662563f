#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace taskmcp {

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct JsonContent {
    nlohmann::json json;

    bool operator==(const JsonContent& o) const { return json == o.json; }
};

using Content = std::variant<TextContent, JsonContent>;

// ---------- Resource ----------

struct ResourceContent {
    std::string uri;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && text == o.text && metadata == o.metadata;
    }
};

struct ResourceResult {
    std::vector<ResourceContent> contents;

    bool operator==(const ResourceResult& o) const { return contents == o.contents; }
};

// ---------- Tool ----------

struct ToolResult {
    std::vector<Content> content;

    bool operator==(const ToolResult& o) const { return content == o.content; }
};

// ---------- Prompt ----------

struct PromptMessage {
    std::string role = "user";
    std::vector<TextContent> content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct PromptResult {
    std::vector<PromptMessage> messages;

    bool operator==(const PromptResult& o) const { return messages == o.messages; }
};

// ---------- Request / Response envelope ----------

enum class RequestType {
    Discover,
    Resource,
    Invoke,
    Prompt
};

std::string_view request_type_to_string(RequestType type);
std::optional<RequestType> request_type_from_string(std::string_view s);

struct Request {
    nlohmann::json id;   // echoed verbatim, null when the caller sent none
    RequestType type = RequestType::Discover;
    std::optional<std::string> uri;
    std::optional<std::string> tool;
    std::optional<std::string> prompt;
    nlohmann::json parameters = nlohmann::json::object();
};

struct Response {
    nlohmann::json id;
    std::optional<std::string> type;     // "<request-type>_response" on success
    nlohmann::json payload = nlohmann::json::object();
    std::optional<std::string> error;

    [[nodiscard]] static Response success(nlohmann::json id, RequestType type,
                                          nlohmann::json payload);
    [[nodiscard]] static Response failure(nlohmann::json id, std::string message);

    /// Answer to a line that could not be decoded. The id is synthesized as
    /// "error_<unix-ms>" and the message never carries parser detail.
    [[nodiscard]] static Response decode_failure();

    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& o) const {
        return id == o.id && type == o.type && payload == o.payload && error == o.error;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const JsonContent& t);
void from_json(const nlohmann::json& j, JsonContent& t);

// Constrained to Content itself so that types merely convertible to Content
// (through the variant's converting constructor) do not pick this overload.
template <typename T, std::enable_if_t<std::is_same_v<T, Content>, int> = 0>
void to_json(nlohmann::json& j, const T& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);

void to_json(nlohmann::json& j, const ResourceResult& t);
void from_json(const nlohmann::json& j, ResourceResult& t);

void to_json(nlohmann::json& j, const ToolResult& t);
void from_json(const nlohmann::json& j, ToolResult& t);

void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);

void to_json(nlohmann::json& j, const PromptResult& t);
void from_json(const nlohmann::json& j, PromptResult& t);

/// Envelope: payload keys are merged at the top level next to id/type.
void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

} // namespace taskmcp
