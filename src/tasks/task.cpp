#include "taskmcp/tasks/task.hpp"
#include "taskmcp/error.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskmcp {

namespace {

// Strings print bare, everything else as JSON; absent fields print empty.
std::string field_text(const nlohmann::json& task, const char* key) {
    auto it = task.find(key);
    if (it == task.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

nlohmann::json field_or_null(const nlohmann::json& task, const char* key) {
    auto it = task.find(key);
    return it == task.end() ? nlohmann::json() : *it;
}

} // anonymous namespace

const std::vector<std::string>& task_statuses() {
    static const std::vector<std::string> values = {"not_started", "started", "done"};
    return values;
}

const std::vector<std::string>& task_priorities() {
    static const std::vector<std::string> values = {"low", "medium", "high"};
    return values;
}

std::string format_task(const nlohmann::json& task) {
    std::ostringstream out;
    out << "ID: " << field_text(task, "id") << "\n"
        << "Task: " << field_text(task, "task") << "\n"
        << "Category: " << field_text(task, "category") << "\n"
        << "Priority: " << field_text(task, "priority") << "\n"
        << "Status: " << field_text(task, "status") << "\n"
        << "Created: " << field_text(task, "create_time");
    return out.str();
}

nlohmann::json task_summary(const nlohmann::json& task) {
    return {
        {"id", field_or_null(task, "id")},
        {"task", field_or_null(task, "task")},
        {"category", field_or_null(task, "category")},
        {"priority", field_or_null(task, "priority")},
        {"status", field_or_null(task, "status")},
        {"create_time", field_or_null(task, "create_time")}
    };
}

const nlohmann::json& task_list(const nlohmann::json& response) {
    if (response.is_object()) {
        auto it = response.find("tasks");
        if (it != response.end() && it->is_array()) return *it;
    }
    throw TaskMcpError("Unexpected task store response: missing 'tasks' array");
}

std::optional<nlohmann::json> find_task(const nlohmann::json& tasks, const std::string& task_id) {
    if (task_id.empty()) return std::nullopt;
    char* end = nullptr;
    double wanted = std::strtod(task_id.c_str(), &end);
    if (end != task_id.c_str() + task_id.size() || std::isnan(wanted)) return std::nullopt;

    for (const auto& task : tasks) {
        if (!task.is_object()) continue;
        auto it = task.find("id");
        if (it != task.end() && it->is_number() && it->get<double>() == wanted) {
            return task;
        }
    }
    return std::nullopt;
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << 'Z';
    return out.str();
}

} // namespace taskmcp
