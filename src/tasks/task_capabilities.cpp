#include "taskmcp/tasks/task_capabilities.hpp"
#include "taskmcp/error.hpp"
#include "taskmcp/tasks/task.hpp"
#include "taskmcp/version.hpp"
#include <spdlog/spdlog.h>

namespace taskmcp {

namespace {

bool truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    if (value.is_number()) return value.get<double>() != 0.0;
    return true;
}

/// obj[key] when truthy, else fallback.
nlohmann::json pick(const nlohmann::json& obj, const char* key, nlohmann::json fallback) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && truthy(*it)) return *it;
    }
    return fallback;
}

nlohmann::json member(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nlohmann::json() : *it;
}

std::string display(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::optional<std::string> optional_string(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

ParamSpec with_min_length(ParamSpec spec, std::size_t n) {
    spec.min_length = n;
    return spec;
}

ParamSpec task_id_param(std::string description) {
    ParamSpec spec = number_param("taskId", std::move(description), true);
    spec.integer = true;
    spec.minimum = 1;
    return spec;
}

ParamSpec status_param(std::string description) {
    return enum_param("status", task_statuses(), std::move(description));
}

ParamSpec priority_param(std::string description) {
    return enum_param("priority", task_priorities(), std::move(description));
}

ToolResult text_result(std::string text) {
    ToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

PromptResult prompt_text(std::string text) {
    PromptMessage message;
    message.content.push_back(TextContent{std::move(text)});
    PromptResult result;
    result.messages.push_back(std::move(message));
    return result;
}

std::string task_path(const nlohmann::json& params) {
    return "/tasks/" + std::to_string(params.at("taskId").get<long long>());
}

// ---------- Resources ----------

ResourceResult read_task_list(ApiClient& api) {
    ResourceResult result;
    try {
        nlohmann::json response = api.call("GET", "/tasks");
        for (const auto& task : task_list(response)) {
            ResourceContent item;
            item.uri = "tasks://task/" + display(member(task, "id"));
            item.text = format_task(task);
            item.metadata = task_summary(task);
            result.contents.push_back(std::move(item));
        }
    } catch (const std::exception& e) {
        spdlog::error("Error fetching tasks: {}", e.what());
        result.contents.clear();
        result.contents.push_back(ResourceContent{
            "tasks://error",
            std::string("Error retrieving tasks: ") + e.what(),
            {{"error", e.what()}}
        });
    }
    return result;
}

ResourceResult read_task(ApiClient& api, const std::string& uri, const UriParams& params) {
    const std::string& task_id = params.at("taskId");
    ResourceResult result;
    try {
        nlohmann::json response = api.call("GET", "/tasks");
        auto task = find_task(task_list(response), task_id);
        if (!task) {
            result.contents.push_back(ResourceContent{
                uri, "Task with ID " + task_id + " not found", {{"error", "Task not found"}}
            });
            return result;
        }
        result.contents.push_back(ResourceContent{uri, format_task(*task), *task});
    } catch (const std::exception& e) {
        spdlog::error("Error fetching task {}: {}", task_id, e.what());
        result.contents.clear();
        result.contents.push_back(ResourceContent{
            uri, "Error retrieving task " + task_id + ": " + e.what(), {{"error", e.what()}}
        });
    }
    return result;
}

// ---------- Tools ----------

ToolResult list_tasks(ApiClient& api, const Schema& schema, const nlohmann::json& params) {
    if (auto err = validate_parameters(schema, params)) {
        return text_result("Invalid parameters: " + *err);
    }
    auto status = optional_string(params, "status");
    auto priority = optional_string(params, "priority");

    try {
        QueryParams query;
        if (status) query["status"] = *status;
        if (priority) query["priority"] = *priority;

        nlohmann::json response = api.call("GET", "/tasks", std::nullopt, query);
        const nlohmann::json& tasks = task_list(response);

        std::string text = "Found " + std::to_string(tasks.size()) + " tasks";
        if (status) text += " with status '" + *status + "'";
        if (priority) text += " and priority '" + *priority + "'";
        text += ".";

        ToolResult result = text_result(std::move(text));
        result.content.push_back(JsonContent{tasks});
        return result;
    } catch (const std::exception& e) {
        return text_result(std::string("Error listing tasks: ") + e.what());
    }
}

ToolResult create_task(ApiClient& api, const Schema& schema, const nlohmann::json& params) {
    if (auto err = validate_parameters(schema, params)) {
        return text_result("Invalid parameters: " + *err);
    }
    std::string task = params.at("task").get<std::string>();
    std::string category = params.at("category").get<std::string>();
    auto priority = optional_string(params, "priority");
    auto status = optional_string(params, "status");

    try {
        nlohmann::json body = {{"task", task}, {"category", category}};
        if (priority) body["priority"] = *priority;
        if (status) body["status"] = *status;

        nlohmann::json created = api.call("POST", "/tasks", body);
        nlohmann::json id = member(created, "id");
        spdlog::info("Created new task with ID {}", id.dump());

        ToolResult result = text_result("Task created successfully with ID: " + display(id));
        result.content.push_back(JsonContent{{
            {"id", id},
            {"task", pick(created, "task", task)},
            {"category", pick(created, "category", category)},
            {"priority", pick(created, "priority", priority ? *priority : "medium")},
            {"status", pick(created, "status", status ? *status : "not_started")},
            {"create_time", pick(created, "create_time", iso_timestamp_now())}
        }});
        return result;
    } catch (const std::exception& e) {
        return text_result(std::string("Error creating task: ") + e.what());
    }
}

ToolResult update_task(ApiClient& api, const Schema& schema, const nlohmann::json& params) {
    if (auto err = validate_parameters(schema, params)) {
        return text_result("Invalid parameters: " + *err);
    }
    long long task_id = params.at("taskId").get<long long>();

    nlohmann::json body = nlohmann::json::object();
    for (const char* field : {"task", "category", "priority", "status"}) {
        if (auto value = optional_string(params, field)) body[field] = *value;
    }
    if (body.empty()) {
        return text_result("No updates provided. Task remains unchanged.");
    }

    try {
        nlohmann::json updated = api.call("PATCH", task_path(params), body);
        auto field = [&](const char* key) { return member(updated, key); };
        ToolResult result = text_result("Task " + std::to_string(task_id) + " updated successfully.");
        result.content.push_back(JsonContent{{
            {"id", field("id")},
            {"task", field("task")},
            {"category", field("category")},
            {"priority", field("priority")},
            {"status", field("status")},
            {"created", field("create_time")}
        }});
        return result;
    } catch (const std::exception& e) {
        return text_result(std::string("Error updating task: ") + e.what());
    }
}

ToolResult delete_task(ApiClient& api, const Schema& schema, const nlohmann::json& params) {
    if (auto err = validate_parameters(schema, params)) {
        return text_result("Invalid parameters: " + *err);
    }
    long long task_id = params.at("taskId").get<long long>();

    try {
        nlohmann::json response = api.call("DELETE", task_path(params));
        spdlog::info("Deleted task ID {}", task_id);
        nlohmann::json message = pick(response, "message", nullptr);
        if (message.is_string()) return text_result(message.get<std::string>());
        return text_result("Task " + std::to_string(task_id) + " deleted successfully.");
    } catch (const std::exception& e) {
        return text_result(std::string("Error deleting task: ") + e.what());
    }
}

// ---------- Prompts ----------

void require_valid(const Schema& schema, const nlohmann::json& params) {
    if (auto err = validate_parameters(schema, params)) {
        throw TaskMcpError("Invalid parameters: " + *err);
    }
}

} // anonymous namespace

void register_task_capabilities(Registry& registry, ApiClient& api) {
    ApiClient* client = &api;

    registry.add_resource(ResourceEntry{
        "tasks",
        "Retrieves a list of all tasks in the system with their details",
        UriTemplate::parse("tasks://list"),
        {},
        [client](const std::string&, const UriParams&) { return read_task_list(*client); }
    });

    registry.add_resource(ResourceEntry{
        "task",
        "Retrieves details of a specific task by its ID",
        UriTemplate::parse("tasks://task/{taskId}"),
        {string_param("taskId", "The unique ID of the task", true)},
        [client](const std::string& uri, const UriParams& params) {
            return read_task(*client, uri, params);
        }
    });

    Schema list_schema = {
        status_param("Filter tasks by status (optional)"),
        priority_param("Filter tasks by priority level (optional)")
    };
    registry.add_tool(ToolEntry{
        "listTasks",
        "Lists all tasks in the system, optionally filtered by status and/or priority",
        list_schema,
        nlohmann::json::array({
            {{"description", "List all tasks"}, {"params", nlohmann::json::object()}},
            {{"description", "List all high priority tasks"}, {"params", {{"priority", "high"}}}},
            {{"description", "List all completed tasks"}, {"params", {{"status", "done"}}}}
        }),
        [client, list_schema](const nlohmann::json& params) {
            return list_tasks(*client, list_schema, params);
        }
    });

    Schema create_schema = {
        with_min_length(string_param("task", "The task description or title", true), 1),
        with_min_length(string_param("category",
            "Task category (e.g., 'Development', 'Documentation')", true), 1),
        priority_param("Task priority level (defaults to 'medium' if not specified)"),
        status_param("Initial task status (defaults to 'not_started' if not specified)")
    };
    registry.add_tool(ToolEntry{
        "createTask",
        "Creates a new task with the specified details",
        create_schema,
        nlohmann::json::array({
            {{"description", "Create a basic task"},
             {"params", {{"task", "Implement login page"}, {"category", "Development"}}}},
            {{"description", "Create a high priority task"},
             {"params", {{"task", "Fix critical security bug"}, {"category", "Security"},
                         {"priority", "high"}}}}
        }),
        [client, create_schema](const nlohmann::json& params) {
            return create_task(*client, create_schema, params);
        }
    });

    Schema update_schema = {
        task_id_param("The unique ID of the task to update"),
        string_param("task", "New task description/title (if you want to change it)"),
        string_param("category", "New task category (if you want to change it)"),
        priority_param("New task priority (if you want to change it)"),
        status_param("New task status (if you want to change it)")
    };
    registry.add_tool(ToolEntry{
        "updateTask",
        "Updates an existing task with new values for one or more fields",
        update_schema,
        nlohmann::json::array({
            {{"description", "Mark a task as completed"},
             {"params", {{"taskId", 5}, {"status", "done"}}}},
            {{"description", "Change task priority"},
             {"params", {{"taskId", 3}, {"priority", "high"}}}},
            {{"description", "Rename a task"},
             {"params", {{"taskId", 7}, {"task", "Implement OAuth login"}}}}
        }),
        [client, update_schema](const nlohmann::json& params) {
            return update_task(*client, update_schema, params);
        }
    });

    Schema delete_schema = {task_id_param("The unique ID of the task to delete")};
    registry.add_tool(ToolEntry{
        "deleteTask",
        "Permanently deletes a task from the system",
        delete_schema,
        nlohmann::json::array({
            {{"description", "Delete a specific task"}, {"params", {{"taskId", 12}}}}
        }),
        [client, delete_schema](const nlohmann::json& params) {
            return delete_task(*client, delete_schema, params);
        }
    });

    registry.add_prompt(PromptEntry{
        "listAllTasks",
        "Lists all tasks grouped by category with priority summary",
        {},
        "Use this prompt when you want to see all tasks organized by category with priority distribution",
        [](const nlohmann::json&) {
            return prompt_text("Please list all tasks in my task management system. Group them by "
                               "category and summarize the priorities for each category.");
        }
    });

    Schema natural_schema = {
        with_min_length(string_param("description",
            "A natural language description of the task to create", true), 10)
    };
    registry.add_prompt(PromptEntry{
        "createTaskNaturalLanguage",
        "Creates a task from a natural language description by extracting key details",
        natural_schema,
        "Use this when you have a detailed task description and want the AI to determine the "
        "best category and priority",
        [natural_schema](const nlohmann::json& params) {
            require_valid(natural_schema, params);
            return prompt_text(
                "Please analyze this task description and create an appropriate task:\n\n\"" +
                params.at("description").get<std::string>() +
                "\"\n\nExtract the most suitable category, determine an appropriate priority "
                "level, and create the task with the right parameters.");
        }
    });

    Schema new_task_schema = {
        with_min_length(string_param("task", "The task description or title", true), 1),
        with_min_length(string_param("category", "Task category", true), 1),
        priority_param("Task priority level")
    };
    registry.add_prompt(PromptEntry{
        "createNewTask",
        "Creates a new task with specific title, category and optional priority",
        new_task_schema,
        "Use this when you have specific task details to create",
        [new_task_schema](const nlohmann::json& params) {
            require_valid(new_task_schema, params);
            auto priority = optional_string(params, "priority");
            return prompt_text(
                "Please create a new task in my task management system with the following "
                "details:\n\nTask: " + params.at("task").get<std::string>() +
                "\nCategory: " + params.at("category").get<std::string>() +
                "\n" + (priority ? "Priority: " + *priority : std::string()) +
                "\n\nPlease confirm once the task is created and provide the task ID for "
                "reference.");
        }
    });

    Schema report_schema = {status_param("Filter by task status")};
    registry.add_prompt(PromptEntry{
        "taskProgressReport",
        "Generates a progress report on tasks with key statistics and insights",
        report_schema,
        "Use this when you need an overview of task progress and areas needing attention",
        [report_schema](const nlohmann::json& params) {
            require_valid(report_schema, params);
            auto status = optional_string(params, "status");
            return prompt_text(
                "Please provide a progress report on " +
                (status ? "all " + *status + " tasks" : std::string("all tasks")) +
                ".\n\nInclude:\n"
                "1. How many tasks are in each status category\n"
                "2. Which high priority tasks need attention\n"
                "3. Any categories with a high concentration of incomplete tasks");
        }
    });
}

ServerInfo task_server_info() {
    ServerInfo info;
    info.name = "Task Management API Server";
    info.version = std::string(LIBRARY_VERSION);
    info.description = "Task Management API that provides CRUD operations for tasks with "
                       "categories, priorities, and statuses";
    info.publisher = "TaskMaster API";
    info.examples = nlohmann::json::array({
        {{"description", "List all tasks in the system"},
         {"tool", "listTasks"},
         {"parameters", nlohmann::json::object()}},
        {{"description", "Create a high priority development task"},
         {"tool", "createTask"},
         {"parameters", {{"task", "Implement authentication middleware"},
                         {"category", "Development"},
                         {"priority", "high"}}}},
        {{"description", "Mark a task as complete"},
         {"tool", "updateTask"},
         {"parameters", {{"taskId", 5}, {"status", "done"}}}}
    });
    return info;
}

} // namespace taskmcp
