#ifndef TMCPS_MCP_TOOLS_HPP
#define TMCPS_MCP_TOOLS_HPP

// MCP tool registry: the immutable catalog of tools and dispatch of tool calls.
// Built once at startup; read concurrently by every session without locking.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// One content block of a tool result. Only "text" blocks are produced.
struct ContentBlock {
    std::string type = "text";
    std::string text;
};

// Outcome of running a tool body.
enum class ToolStatus {
    success,
    invalid_params,   // arguments rejected by the tool
    execution_error,  // the tool body failed
    not_found         // set by the registry only
};

struct ToolResult {
    ToolStatus status = ToolStatus::success;
    std::vector<ContentBlock> content;
    std::string error_message;
};

// Convenience constructors used by the tool bodies.
ToolResult text_result(const std::string &text);
ToolResult invalid_params(const std::string &message);
ToolResult execution_error(const std::string &message);

// A tool handler function: receives the arguments object, returns the result.
// A handler may also throw; the registry converts that to execution_error.
using ToolHandler = std::function<ToolResult(const json &arguments)>;

// Description of a tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Takes the full catalog. Throws std::invalid_argument on a duplicate or
    // empty name, or a definition without a handler.
    explicit ToolRegistry(std::vector<ToolDefinition> definitions);

    // Catalog in registration order.
    const std::vector<ToolDefinition> &list() const { return definitions_; }

    // Returns nullptr if no tool has this name.
    const ToolDefinition *find(const std::string &tool_name) const;

    // Run a tool. Unknown names give ToolStatus::not_found; exceptions from the
    // handler give ToolStatus::execution_error with the exception text. A
    // successful result without content gets one empty text block.
    ToolResult invoke(const std::string &tool_name, const json &arguments) const;

    // Payload of tools/list: {"tools": [{name, description, inputSchema}, ...]}.
    json build_tools_list_response() const;

private:
    std::vector<ToolDefinition> definitions_;
};

// Convert content blocks to the wire "content" array.
json content_to_json(const std::vector<ContentBlock> &content);

} // namespace mcp_tools

#endif // TMCPS_MCP_TOOLS_HPP
