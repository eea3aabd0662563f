#pragma once
#include <string_view>

namespace taskmcp {

constexpr std::string_view LIBRARY_VERSION = "1.0.0";
constexpr std::string_view USER_AGENT      = "TaskMcpServer/1.0";

} // namespace taskmcp
