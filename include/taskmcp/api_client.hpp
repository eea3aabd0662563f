#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace taskmcp {

using QueryParams = std::map<std::string, std::string>;

/// Authenticated access to the remote task store.
///
/// call() resolves to the parsed JSON body or throws ApiError. Implementations
/// must be safe to call from several worker threads at once.
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual nlohmann::json call(const std::string& method, const std::string& path,
                                const std::optional<nlohmann::json>& body = std::nullopt,
                                const QueryParams& query = {}) = 0;
};

/// ApiClient over cpp-httplib. Each call opens its own connection so
/// concurrent requests never share a client.
class HttpApiClient : public ApiClient {
public:
    struct Options {
        std::string base_url;       // e.g. https://host/api
        std::optional<std::string> api_key;
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{20};
    };

    /// Throws ConfigError when the base URL is not http(s)://host[:port][/path].
    explicit HttpApiClient(Options opts);

    nlohmann::json call(const std::string& method, const std::string& path,
                        const std::optional<nlohmann::json>& body = std::nullopt,
                        const QueryParams& query = {}) override;

    /// scheme://host[:port] part of the base URL.
    [[nodiscard]] const std::string& origin() const noexcept { return origin_; }
    /// Path prefix of the base URL, without trailing slash.
    [[nodiscard]] const std::string& path_prefix() const noexcept { return path_prefix_; }

private:
    Options opts_;
    std::string origin_;
    std::string path_prefix_;
};

} // namespace taskmcp
