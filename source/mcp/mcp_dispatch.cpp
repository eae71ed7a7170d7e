#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <string>
#include <unordered_map>

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

static const std::string NOTIFICATION_PREFIX = "notifications/";

json build_initialize_result(const server_config::ServerConfig &config) {
    json capabilities;
    capabilities["tools"] = json::object();
    if (config.tools_list_changed) {
        capabilities["tools"]["listChanged"] = true;
    }

    json server_info;
    server_info["name"] = config.server_name;
    server_info["version"] = config.server_version;

    json result;
    result["protocolVersion"] = config.protocol_version;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    return result;
}

// Handle the "initialize" request. Client capabilities are accepted as-is.
static json handle_initialize(const json &request_id, const json &params, const ServerContext &context) {
    (void)params;
    return json_rpc::build_response(request_id, build_initialize_result(context.config));
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id, const json &params, const ServerContext &context) {
    (void)params;
    return json_rpc::build_response(request_id, context.registry.build_tools_list_response());
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params, const ServerContext &context) {
    // A missing or non-string name cannot match any tool; it is reported the
    // same way as an unknown one, with the name printed as JSON.
    if (!params.contains("name") || !params["name"].is_string()) {
        json name = params.contains("name") ? params["name"] : json();
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                               "Unknown tool: " + json_rpc::serialize(name));
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments")) {
        arguments = params["arguments"];
        if (!arguments.is_object()) {
            return json_rpc::build_error_response(
                request_id, json_rpc::INVALID_PARAMS,
                std::string("Invalid parameters: arguments must be a JSON object, got ") + arguments.type_name());
        }
    }

    debug_log::log("tools/call " + tool_name + " arguments=" +
                   utf8_sanitize::truncate_for_log(json_rpc::serialize(arguments), 512));

    mcp_tools::ToolResult tool_result = context.registry.invoke(tool_name, arguments);

    switch (tool_result.status) {
    case mcp_tools::ToolStatus::success: {
        json result;
        result["content"] = mcp_tools::content_to_json(tool_result.content);
        return json_rpc::build_response(request_id, result);
    }
    case mcp_tools::ToolStatus::not_found:
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                               "Unknown tool: " + tool_name);
    case mcp_tools::ToolStatus::invalid_params:
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               tool_result.error_message);
    case mcp_tools::ToolStatus::execution_error:
        break;
    }
    return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                           "Tool execution error: " + tool_result.error_message);
}

MethodHandler find_method_handler(const std::string &method) {
    static const std::unordered_map<std::string, MethodHandler> method_handlers = {
        {"initialize", handle_initialize},
        {"tools/list", handle_tools_list},
        {"tools/call", handle_tools_call},
    };

    auto handler_iterator = method_handlers.find(method);
    if (handler_iterator == method_handlers.end()) {
        return nullptr;
    }
    return handler_iterator->second;
}

// Route a message to its handler. Always returns a response envelope; the
// caller decides whether it goes on the wire.
static json route_message(const json &message, const ServerContext &context) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    MethodHandler handler = find_method_handler(method);
    if (handler == nullptr) {
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                               "Method not found: " + method);
    }
    return handler(request_id, params, context);
}

json dispatch_message(const json &message, const ServerContext &context) {
    std::string method = json_rpc::get_method(message);
    bool notification = json_rpc::is_notification(message);

    debug_log::log(std::string(notification ? "notification " : "request ") + method);

    // The notifications/ family never has handler logic that needs a reply.
    if (method.compare(0, NOTIFICATION_PREFIX.size(), NOTIFICATION_PREFIX) == 0) {
        return nullptr;
    }

    json response;
    try {
        response = route_message(message, context);
    } catch (const std::exception &error) {
        debug_log::log("dispatch of '" + method + "' failed: " + error.what());
        response = json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INTERNAL_ERROR,
                                                   std::string("Internal error: ") + error.what());
    }

    // No id means no reply, whatever happened above.
    if (notification) {
        return nullptr;
    }
    return response;
}

std::optional<std::string> dispatch_text(const std::string &raw_text, const ServerContext &context) {
    json_rpc::ParseResult parse_result = json_rpc::parse_request(raw_text);
    if (!parse_result.success) {
        debug_log::log("Failed to parse incoming message: " + parse_result.error_detail);
        json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR,
                                                              "Parse error: " + parse_result.error_detail);
        return json_rpc::serialize(error_response);
    }

    json response = dispatch_message(parse_result.message, context);

    // Notifications return null (no response needed).
    if (response.is_null()) {
        return std::nullopt;
    }
    return json_rpc::serialize(response);
}

} // namespace mcp_dispatch
