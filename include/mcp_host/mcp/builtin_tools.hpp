#pragma once

#include <mcp_host/mcp/tool_registry.hpp>

#include <cstddef>

namespace mcp_host {

// Register the tools compiled into the host: "text", "datetime" and
// "environment". Must run before plugin tools are added so built-ins win
// name collisions. Returns the number of tools accepted.
std::size_t RegisterBuiltInTools(ToolRegistry& registry);

} // namespace mcp_host
