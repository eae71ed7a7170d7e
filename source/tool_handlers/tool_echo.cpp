#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "echo".
// Missing or null "text" echoes the empty string; other non-string values are
// echoed in their JSON form.

static mcp_tools::ToolResult handle_echo(const json &arguments) {
    std::string text;
    if (arguments.contains("text")) {
        const json &value = arguments["text"];
        if (value.is_string()) {
            text = value.get<std::string>();
        } else if (!value.is_null()) {
            text = value.dump();
        }
    }
    return mcp_tools::text_result("Echo: " + text);
}

namespace tool_echo {

mcp_tools::ToolDefinition make_definition() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["text"] = {
        {"type", "string"},
        {"description", "Text to echo back"}
    };
    input_schema["required"] = json::array({"text"});

    return {
        "echo",
        "Echo back the input text",
        input_schema,
        handle_echo
    };
}

} // namespace tool_echo
