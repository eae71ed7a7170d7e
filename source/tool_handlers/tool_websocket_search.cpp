#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "websocket_search".
// Canned search answer that embeds the query; the query must be a non-empty string.

static mcp_tools::ToolResult handle_websocket_search(const json &arguments) {
    if (!arguments.contains("query") || !arguments["query"].is_string() ||
        arguments["query"].get<std::string>().empty()) {
        return mcp_tools::invalid_params("Invalid parameters: 'query' is required for websocket_search");
    }

    std::string query = arguments["query"].get<std::string>();
    return mcp_tools::text_result(
        "\xF0\x9F\x94\x8D WEBSOCKET MCP SEARCH for '" + query +
        "': Found comprehensive results via WebSocket connection. Server located relevant information about " +
        query + " from distributed sources. [Response from WebSocket MCP Server]");
}

namespace tool_websocket_search {

mcp_tools::ToolDefinition make_definition() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"query", {{"type", "string"}, {"description", "The search query"}}}
    };
    input_schema["required"] = json::array({"query"});
    input_schema["additionalProperties"] = false;

    return {
        "websocket_search",
        "Search for information via WebSocket MCP server",
        input_schema,
        handle_websocket_search
    };
}

} // namespace tool_websocket_search
