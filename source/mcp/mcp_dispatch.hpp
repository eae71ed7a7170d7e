#ifndef TMCPS_MCP_DISPATCH_HPP
#define TMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Stateless: every call is a pure function of the message and the context.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Everything a dispatch needs. Both members outlive every session.
struct ServerContext {
    const server_config::ServerConfig &config;
    const mcp_tools::ToolRegistry &registry;
};

// Handler for one method: receives the request id and params object, returns
// the complete response envelope.
using MethodHandler = json (*)(const json &request_id, const json &params, const ServerContext &context);

// Look up the handler of a top-level method. Returns nullptr for unknown
// methods and for the notifications/ family (which never has a handler).
MethodHandler find_method_handler(const std::string &method);

// Payload of the initialize result, from the configuration only.
json build_initialize_result(const server_config::ServerConfig &config);

// Dispatch a parsed envelope. Returns the response envelope, or a null json
// value when nothing must be sent (notifications, whatever their outcome).
json dispatch_message(const json &message, const ServerContext &context);

// Parse and dispatch one raw message unit. Returns the serialized response,
// or std::nullopt when nothing must be sent. Malformed input yields a
// PARSE_ERROR response with a null id. Never throws.
std::optional<std::string> dispatch_text(const std::string &raw_text, const ServerContext &context);

} // namespace mcp_dispatch

#endif // TMCPS_MCP_DISPATCH_HPP
