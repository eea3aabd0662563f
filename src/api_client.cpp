#include "taskmcp/api_client.hpp"
#include "taskmcp/codec.hpp"
#include "taskmcp/error.hpp"
#include "taskmcp/version.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace taskmcp {

namespace {

nlohmann::json parse_body(const std::string& body) {
    if (body.empty()) return nlohmann::json::object();
    return Codec::parse(body);
}

} // anonymous namespace

HttpApiClient::HttpApiClient(Options opts)
    : opts_(std::move(opts)) {
    const std::string& url = opts_.base_url;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("Invalid API base URL: " + url);
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw ConfigError("Unsupported API base URL scheme: " + scheme);
    }

    auto slash = url.find('/', scheme_end + 3);
    origin_ = url.substr(0, slash);
    if (origin_.size() == scheme_end + 3) {
        throw ConfigError("API base URL has no host: " + url);
    }
    if (slash != std::string::npos) {
        path_prefix_ = url.substr(slash);
        while (!path_prefix_.empty() && path_prefix_.back() == '/') path_prefix_.pop_back();
    }
}

nlohmann::json HttpApiClient::call(const std::string& method, const std::string& path,
                                   const std::optional<nlohmann::json>& body,
                                   const QueryParams& query) {
    if (!opts_.api_key || opts_.api_key->empty()) {
        throw ApiError(0, nullptr,
            "TASK_MANAGER_API_KEY is not defined. Set it in the environment or pass --api-key.");
    }

    httplib::Params params(query.begin(), query.end());
    std::string target = httplib::append_query_params(path_prefix_ + path, params);
    std::string payload = body ? body->dump() : std::string();

    spdlog::debug("API request: {} {}{} body={}", method, origin_, target,
                  payload.empty() ? "null" : payload);

    httplib::Client client(origin_);
    if (!client.is_valid()) {
        throw ApiError(0, nullptr, "API request failed: cannot create client for " + origin_);
    }
    client.set_connection_timeout(static_cast<time_t>(opts_.connect_timeout.count()), 0);
    client.set_read_timeout(static_cast<time_t>(opts_.read_timeout.count()), 0);

    httplib::Headers headers = {
        {"X-API-Key", *opts_.api_key},
        {"Accept", "application/json"},
        {"User-Agent", std::string(USER_AGENT)}
    };
    const char* content_type = "application/json";

    auto send = [&]() -> httplib::Result {
        if (method == "GET") return client.Get(target, headers);
        if (method == "POST") return client.Post(target, headers, payload, content_type);
        if (method == "PATCH") return client.Patch(target, headers, payload, content_type);
        if (method == "PUT") return client.Put(target, headers, payload, content_type);
        if (method == "DELETE") {
            return payload.empty() ? client.Delete(target, headers)
                                   : client.Delete(target, headers, payload, content_type);
        }
        throw ApiError(0, nullptr, "Unsupported HTTP method: " + method);
    };
    httplib::Result result = send();

    if (!result) {
        std::string reason = httplib::to_string(result.error());
        spdlog::error("API request {} {}{} failed: {}", method, origin_, target, reason);
        throw ApiError(0, nullptr, "API request failed: " + reason);
    }

    if (result->status >= 400) {
        nlohmann::json error_body;
        try {
            error_body = parse_body(result->body);
        } catch (const ParseError&) {
            error_body = result->body;
        }
        spdlog::error("API request {} {}{} returned {}: {}", method, origin_, target,
                      result->status, error_body.dump());
        throw ApiError(result->status, error_body,
                       "API Error (" + std::to_string(result->status) + "): " + error_body.dump());
    }

    try {
        return parse_body(result->body);
    } catch (const ParseError& e) {
        spdlog::error("API response for {} {} is not JSON: {}", method, target, e.what());
        throw ApiError(result->status, result->body,
                       std::string("API returned invalid JSON: ") + e.what());
    }
}

} // namespace taskmcp
