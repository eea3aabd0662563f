#pragma once
#include "../api_client.hpp"
#include "../discovery.hpp"
#include "../registry.hpp"

namespace taskmcp {

/// Register the task manager's resources, tools and prompts.
/// The handlers keep a reference to api, which must outlive the registry.
void register_task_capabilities(Registry& registry, ApiClient& api);

/// Name, version, description, publisher and example calls for discovery.
ServerInfo task_server_info();

} // namespace taskmcp
