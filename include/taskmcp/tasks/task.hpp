#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace taskmcp {

/// Values accepted by the task store.
const std::vector<std::string>& task_statuses();
const std::vector<std::string>& task_priorities();

/// Multi-line human summary: ID, Task, Category, Priority, Status, Created.
std::string format_task(const nlohmann::json& task);

/// {id, task, category, priority, status, create_time} taken from a task object.
nlohmann::json task_summary(const nlohmann::json& task);

/// The "tasks" array of a GET /tasks response.
/// Throws TaskMcpError when the response has no such array.
const nlohmann::json& task_list(const nlohmann::json& response);

/// Task whose numeric id equals the decimal text in task_id, if any.
std::optional<nlohmann::json> find_task(const nlohmann::json& tasks, const std::string& task_id);

/// Current UTC time as an ISO-8601 string with milliseconds.
std::string iso_timestamp_now();

} // namespace taskmcp
