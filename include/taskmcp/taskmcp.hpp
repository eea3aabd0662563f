#pragma once

/// Umbrella header for the taskmcp capability dispatcher.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "uri_template.hpp"
#include "registry.hpp"
#include "discovery.hpp"
#include "dispatcher.hpp"
#include "request_tracker.hpp"
#include "server.hpp"
#include "api_client.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
#include "tasks/task.hpp"
#include "tasks/task_capabilities.hpp"
