#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace mcp_tools {

ToolResult text_result(const std::string &text) {
    ToolResult result;
    result.status = ToolStatus::success;
    result.content.push_back(ContentBlock{"text", text});
    return result;
}

ToolResult invalid_params(const std::string &message) {
    ToolResult result;
    result.status = ToolStatus::invalid_params;
    result.error_message = message;
    return result;
}

ToolResult execution_error(const std::string &message) {
    ToolResult result;
    result.status = ToolStatus::execution_error;
    result.error_message = message;
    return result;
}

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> definitions)
    : definitions_(std::move(definitions)) {
    std::unordered_set<std::string> seen_names;
    for (const auto &definition : definitions_) {
        if (definition.name.empty()) {
            throw std::invalid_argument("tool definition without a name");
        }
        if (!definition.handler) {
            throw std::invalid_argument("tool '" + definition.name + "' has no handler");
        }
        if (!seen_names.insert(definition.name).second) {
            throw std::invalid_argument("duplicate tool name '" + definition.name + "'");
        }
    }
}

const ToolDefinition *ToolRegistry::find(const std::string &tool_name) const {
    for (const auto &definition : definitions_) {
        if (definition.name == tool_name) {
            return &definition;
        }
    }
    return nullptr;
}

ToolResult ToolRegistry::invoke(const std::string &tool_name, const json &arguments) const {
    const ToolDefinition *definition = find(tool_name);
    if (definition == nullptr) {
        ToolResult result;
        result.status = ToolStatus::not_found;
        result.error_message = "Unknown tool: " + tool_name;
        return result;
    }

    ToolResult result;
    try {
        result = definition->handler(arguments);
    } catch (const std::exception &error) {
        debug_log::log("tool '" + tool_name + "' threw: " + error.what());
        return execution_error(error.what());
    }

    if (result.status == ToolStatus::success && result.content.empty()) {
        result.content.push_back(ContentBlock{"text", ""});
    }
    return result;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : definitions_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json content_to_json(const std::vector<ContentBlock> &content) {
    json content_array = json::array();
    for (const auto &block : content) {
        content_array.push_back({{"type", block.type}, {"text", block.text}});
    }
    return content_array;
}

} // namespace mcp_tools
