#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace taskmcp {

class TaskMcpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line that is not a decodable JSON document.
class ParseError : public TaskMcpError {
public:
    using TaskMcpError::TaskMcpError;
};

/// Malformed URI template, raised at registration time.
class TemplateError : public TaskMcpError {
public:
    using TaskMcpError::TaskMcpError;
};

class TransportError : public TaskMcpError {
public:
    using TaskMcpError::TaskMcpError;
};

class ConfigError : public TaskMcpError {
public:
    using TaskMcpError::TaskMcpError;
};

/// Failure reported by the remote task store.
/// status is 0 when no HTTP response was received at all.
class ApiError : public TaskMcpError {
public:
    int status;
    nlohmann::json body;

    ApiError(int status, nlohmann::json body, const std::string& msg)
        : TaskMcpError(msg), status(status), body(std::move(body)) {}
};

} // namespace taskmcp
