#include "tool_handlers/tool_handlers.hpp"

#include <vector>

namespace tool_handlers {

mcp_tools::ToolRegistry build_registry() {
    std::vector<mcp_tools::ToolDefinition> definitions;
    definitions.push_back(tool_echo::make_definition());
    definitions.push_back(tool_add::make_definition());
    definitions.push_back(tool_get_time::make_definition());
    definitions.push_back(tool_websocket_search::make_definition());
    definitions.push_back(tool_websocket_time::make_definition());
    return mcp_tools::ToolRegistry(std::move(definitions));
}

} // namespace tool_handlers
