#ifndef TMCPS_TOOL_HANDLERS_HPP
#define TMCPS_TOOL_HANDLERS_HPP

// Built-in tool catalog.
// Each tool_*.cpp file provides a make_definition() function; build_registry()
// collects them, in catalog order, into the immutable registry.

#include "mcp/mcp_tools.hpp"

namespace tool_echo { mcp_tools::ToolDefinition make_definition(); }
namespace tool_add { mcp_tools::ToolDefinition make_definition(); }
namespace tool_get_time { mcp_tools::ToolDefinition make_definition(); }
namespace tool_websocket_search { mcp_tools::ToolDefinition make_definition(); }
namespace tool_websocket_time { mcp_tools::ToolDefinition make_definition(); }

namespace tool_handlers {

// Build the registry holding every built-in tool:
// echo, add, get_time, websocket_search, websocket_time.
mcp_tools::ToolRegistry build_registry();

} // namespace tool_handlers

#endif // TMCPS_TOOL_HANDLERS_HPP
