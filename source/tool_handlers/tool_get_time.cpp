#include "tool_handlers/tool_handlers.hpp"
#include "utils/local_time.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

using json = nlohmann::json;

static mcp_tools::ToolResult handle_get_time(const json &arguments) {
    (void)arguments;
    return mcp_tools::text_result("Current time: " + local_time::iso8601(std::chrono::system_clock::now()));
}

namespace tool_get_time {

mcp_tools::ToolDefinition make_definition() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["additionalProperties"] = false;

    return {
        "get_time",
        "Get the current time",
        input_schema,
        handle_get_time
    };
}

} // namespace tool_get_time
