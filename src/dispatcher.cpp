#include "taskmcp/dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace taskmcp {

namespace {

const char* const INVALID_FORMAT = "Invalid request format";

std::optional<std::string> string_field(const nlohmann::json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

Dispatcher::Dispatcher(const Registry& registry, ServerInfo info)
    : registry_(registry), discovery_(registry, std::move(info)) {}

ClassifyResult Dispatcher::classify(const nlohmann::json& message) {
    if (!message.is_object()) {
        return Response::failure(nullptr, INVALID_FORMAT);
    }

    Request req;
    if (auto it = message.find("id"); it != message.end()) req.id = *it;

    auto type_name = string_field(message, "type");
    if (!type_name) {
        return Response::failure(req.id, INVALID_FORMAT);
    }
    auto type = request_type_from_string(*type_name);
    if (!type) {
        return Response::failure(req.id, "Unsupported request type: " + *type_name);
    }
    req.type = *type;

    if (auto it = message.find("parameters"); it != message.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Response::failure(req.id,
                std::string(INVALID_FORMAT) + ": 'parameters' must be an object");
        }
        req.parameters = *it;
    }

    switch (req.type) {
        case RequestType::Discover:
            break;
        case RequestType::Resource:
            req.uri = string_field(message, "uri");
            if (!req.uri) {
                return Response::failure(req.id,
                    std::string(INVALID_FORMAT) + ": 'uri' must be a string");
            }
            break;
        case RequestType::Invoke:
            req.tool = string_field(message, "tool");
            if (!req.tool) {
                return Response::failure(req.id,
                    std::string(INVALID_FORMAT) + ": 'tool' must be a string");
            }
            break;
        case RequestType::Prompt:
            req.prompt = string_field(message, "prompt");
            if (!req.prompt) {
                return Response::failure(req.id,
                    std::string(INVALID_FORMAT) + ": 'prompt' must be a string");
            }
            break;
    }
    return req;
}

Response Dispatcher::dispatch(const nlohmann::json& message) const {
    auto classified = classify(message);
    if (auto* rejected = std::get_if<Response>(&classified)) {
        spdlog::debug("Rejected request id={}: {}", rejected->id.dump(), *rejected->error);
        return std::move(*rejected);
    }
    const Request& req = std::get<Request>(classified);
    spdlog::debug("Dispatching {} request id={}", request_type_to_string(req.type), req.id.dump());

    try {
        switch (req.type) {
            case RequestType::Discover:
                return Response::success(req.id, req.type, discovery_.build_manifest());
            case RequestType::Resource:
                return handle_resource(req);
            case RequestType::Invoke:
                return handle_invoke(req);
            case RequestType::Prompt:
                return handle_prompt(req);
        }
    } catch (const std::exception& e) {
        spdlog::warn("{} request id={} failed: {}",
                     request_type_to_string(req.type), req.id.dump(), e.what());
        return Response::failure(req.id, e.what());
    } catch (...) {
        spdlog::warn("{} request id={} failed with a non-standard exception",
                     request_type_to_string(req.type), req.id.dump());
        return Response::failure(req.id, "Unknown error");
    }
    return Response::failure(req.id, "Unsupported request type");
}

Response Dispatcher::handle_resource(const Request& req) const {
    auto match = registry_.match_resource(*req.uri);
    if (!match) {
        return Response::failure(req.id, "No resource handler found for URI: " + *req.uri);
    }
    nlohmann::json payload = match->entry->handler(*req.uri, match->params);
    return Response::success(req.id, req.type, std::move(payload));
}

Response Dispatcher::handle_invoke(const Request& req) const {
    const ToolEntry* tool = registry_.find_tool(*req.tool);
    if (!tool) {
        return Response::failure(req.id, "Tool not found: " + *req.tool);
    }
    nlohmann::json payload = tool->handler(req.parameters);
    return Response::success(req.id, req.type, std::move(payload));
}

Response Dispatcher::handle_prompt(const Request& req) const {
    const PromptEntry* prompt = registry_.find_prompt(*req.prompt);
    if (!prompt) {
        return Response::failure(req.id, "Prompt not found: " + *req.prompt);
    }
    nlohmann::json payload = prompt->handler(req.parameters);
    return Response::success(req.id, req.type, std::move(payload));
}

} // namespace taskmcp
