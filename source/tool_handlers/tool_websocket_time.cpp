#include "tool_handlers/tool_handlers.hpp"
#include "utils/local_time.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

using json = nlohmann::json;

static mcp_tools::ToolResult handle_websocket_time(const json &arguments) {
    (void)arguments;
    std::string timestamp = local_time::format(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
    return mcp_tools::text_result("\xE2\x8F\xB0 WEBSOCKET MCP TIME: " + timestamp +
                                  " [Timestamp from WebSocket MCP Server]");
}

namespace tool_websocket_time {

mcp_tools::ToolDefinition make_definition() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["additionalProperties"] = false;

    return {
        "websocket_time",
        "Get current time from WebSocket server",
        input_schema,
        handle_websocket_time
    };
}

} // namespace tool_websocket_time
