// Tests for the MCP dispatcher: routing, id echo, notification silence and
// the JSON-RPC error taxonomy, driven through dispatch_text() exactly as a
// transport would.

#include "test_helpers.hpp"
#include "protocol/json_rpc.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::check;
using test_helpers::check_equal;

namespace test_dispatch {

// Scenario: echo tool returns "Echo: hi" under the request id.
static bool test_echo_call() {
    test_helpers::Fixture fixture;
    json response = fixture.call(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})");
    json expected = json::parse(
        R"({"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"Echo: hi"}]}})");
    return check_equal(response, expected, "echo call returns Echo: hi");
}

// Scenario: add with a fractional operand.
static bool test_add_call() {
    test_helpers::Fixture fixture;
    json response = fixture.call(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3.5}}})");
    json expected = json::parse(
        R"({"jsonrpc":"2.0","id":2,"result":{"content":[{"type":"text","text":"Result: 5.5"}]}})");
    return check_equal(response, expected, "add 2 + 3.5 returns Result: 5.5");
}

// Scenario: unknown tool maps to METHOD_NOT_FOUND with the tool name.
static bool test_unknown_tool() {
    test_helpers::Fixture fixture;
    json response = fixture.call(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"missing_tool","arguments":{}}})");
    json expected = json::parse(
        R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"Unknown tool: missing_tool"}})");
    return check_equal(response, expected, "unknown tool yields -32601 Unknown tool: missing_tool");
}

// Scenario: notifications/initialized produces nothing.
static bool test_initialized_notification_is_silent() {
    test_helpers::Fixture fixture;
    std::optional<std::string> response =
        mcp_dispatch::dispatch_text(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", fixture.context);
    return check(!response.has_value(), "notifications/initialized produces no output");
}

// Scenario: malformed JSON gives PARSE_ERROR with a null id.
static bool test_malformed_json() {
    test_helpers::Fixture fixture;
    json response = fixture.call("not valid json");
    bool success = true;
    success &= check(response.contains("id") && response["id"].is_null(), "parse error carries id null");
    success &= check_equal(response["error"]["code"], json_rpc::PARSE_ERROR, "parse error code is -32700");
    success &= check(response["error"]["message"].get<std::string>().rfind("Parse error: ", 0) == 0,
                     "parse error message starts with 'Parse error: '");
    success &= check(!response.contains("result"), "parse error has no result member");
    return success;
}

// JSON that is not an object is not an envelope either.
static bool test_non_object_json() {
    test_helpers::Fixture fixture;
    bool success = true;
    for (const char *raw_text : {"[1,2,3]", "42", "\"initialize\"", "null"}) {
        json response = fixture.call(raw_text);
        success &= check(response["error"]["code"] == json_rpc::PARSE_ERROR && response["id"].is_null(),
                         std::string("non-object input ") + raw_text + " yields parse error");
    }
    return success;
}

// Invalid UTF-8 in malformed input must not break serialization of the error.
static bool test_malformed_invalid_utf8() {
    test_helpers::Fixture fixture;
    std::optional<std::string> response = mcp_dispatch::dispatch_text("{\"a\":\xff\xfe}", fixture.context);
    bool success = check(response.has_value(), "malformed invalid UTF-8 still gets a response");
    if (success) {
        json parsed = json::parse(*response);
        success &= check_equal(parsed["error"]["code"], json_rpc::PARSE_ERROR, "and it is a parse error");
    }
    return success;
}

static bool test_initialize() {
    test_helpers::Fixture fixture;
    json response = fixture.call(
        R"({"jsonrpc":"2.0","id":"init-1","method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"conformance-client","version":"0"}}})");
    json expected_result = json::parse(
        R"({"protocolVersion":"2025-03-26","capabilities":{"tools":{"listChanged":true}},"serverInfo":{"name":"python-test-server","version":"1.0.0"}})");
    bool success = true;
    success &= check_equal(response["id"], "init-1", "initialize echoes string id");
    success &= check_equal(response["result"], expected_result, "initialize returns the stdio deployment payload");
    return success;
}

static bool test_initialize_websocket_profile() {
    server_config::ServerConfig config = server_config::websocket_defaults();
    mcp_tools::ToolRegistry registry = tool_handlers::build_registry();
    mcp_dispatch::ServerContext context{config, registry};

    json result = mcp_dispatch::build_initialize_result(context.config);
    json expected_result = json::parse(
        R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"websocket-demo-mcp-server","version":"1.0.0"}})");
    return check_equal(result, expected_result, "websocket deployment advertises 2024-11-05 and empty tools capability");
}

static bool test_tools_list() {
    test_helpers::Fixture fixture;
    json first = fixture.call(R"({"jsonrpc":"2.0","id":10,"method":"tools/list"})");
    fixture.call(R"({"jsonrpc":"2.0","id":11,"method":"tools/call","params":{"name":"echo","arguments":{"text":"x"}}})");
    json second = fixture.call(R"({"jsonrpc":"2.0","id":10,"method":"tools/list","params":{}})");

    bool success = true;
    const json &tools = first["result"]["tools"];
    success &= check(tools.is_array() && tools.size() == 5, "tools/list returns five tools");

    std::vector<std::string> names;
    for (const auto &tool : tools) {
        names.push_back(tool["name"].get<std::string>());
        success &= check(tool.contains("description") && tool["inputSchema"]["type"] == "object",
                         "tool " + tool["name"].get<std::string>() + " has description and object schema");
    }
    std::vector<std::string> expected_names = {"echo", "add", "get_time", "websocket_search", "websocket_time"};
    success &= check(names == expected_names, "tools/list order is echo, add, get_time, websocket_search, websocket_time");
    success &= check_equal(second, first, "tools/list is identical across calls");
    return success;
}

// Parsed integers may come back unsigned, so compare the JSON kind, not value_t.
static bool same_kind(const json &left, const json &right) {
    return left.is_null() == right.is_null() && left.is_string() == right.is_string() &&
           left.is_number_integer() == right.is_number_integer() &&
           left.is_number_float() == right.is_number_float();
}

static bool test_id_echo_types() {
    test_helpers::Fixture fixture;
    bool success = true;
    for (const json &request_id : {json(0), json(-7), json(12345678901LL), json(2.5), json("abc"), json(""), json(nullptr)}) {
        json request = {{"jsonrpc", "2.0"}, {"id", request_id}, {"method", "tools/list"}};
        json response = fixture.call(request.dump());
        success &= check(response.contains("id") && response["id"] == request_id &&
                         same_kind(response["id"], request_id),
                         "id " + request_id.dump() + " echoed with same type and value");
    }
    return success;
}

static bool test_unknown_method() {
    test_helpers::Fixture fixture;
    json response = fixture.call(R"({"jsonrpc":"2.0","id":5,"method":"resources/list"})");
    json expected = json::parse(
        R"({"jsonrpc":"2.0","id":5,"error":{"code":-32601,"message":"Method not found: resources/list"}})");
    return check_equal(response, expected, "unknown method yields -32601 Method not found");
}

static bool test_missing_method() {
    test_helpers::Fixture fixture;
    json response = fixture.call(R"({"jsonrpc":"2.0","id":6})");
    bool success = true;
    success &= check_equal(response["id"], 6, "request without method still echoes id");
    success &= check_equal(response["error"]["code"], json_rpc::METHOD_NOT_FOUND, "request without method is -32601");
    return success;
}

// No id means no output, whatever the outcome.
static bool test_notifications_never_answered() {
    test_helpers::Fixture fixture;
    const char *notifications[] = {
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})",
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"missing_tool"}})",
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"add","arguments":{"a":"x"}}})",
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"websocket_search","arguments":{}}})",
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"echo","arguments":[1]}})",
        R"({"jsonrpc":"2.0","method":"no/such/method"})",
        R"({"jsonrpc":"2.0","method":"initialize"})",
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":1}})",
    };
    bool success = true;
    for (const char *raw_text : notifications) {
        std::optional<std::string> response = mcp_dispatch::dispatch_text(raw_text, fixture.context);
        success &= check(!response.has_value(), std::string("no output for ") + raw_text);
    }
    return success;
}

// A notifications/ method that carries an id is still never answered.
static bool test_notification_family_with_id() {
    test_helpers::Fixture fixture;
    std::optional<std::string> response = mcp_dispatch::dispatch_text(
        R"({"jsonrpc":"2.0","id":9,"method":"notifications/initialized"})", fixture.context);
    return check(!response.has_value(), "notifications/* with an id produces no output");
}

static bool test_arguments_not_object() {
    test_helpers::Fixture fixture;
    bool success = true;
    for (const char *arguments : {"[1,2]", "\"text\"", "5", "null", "true"}) {
        json response = fixture.call(std::string(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":)") +
                                     arguments + "}}");
        success &= check(response["error"]["code"] == json_rpc::INVALID_PARAMS && response["id"] == 7,
                         std::string("arguments ") + arguments + " yields -32602");
        success &= check(response["error"]["message"].get<std::string>().find("arguments must be a JSON object") != std::string::npos,
                         "message explains arguments must be an object");
    }
    return success;
}

static bool test_arguments_absent_defaults_to_empty() {
    test_helpers::Fixture fixture;
    json response = fixture.call(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"echo"}})");
    return check_equal(response["result"]["content"][0]["text"], "Echo: ", "echo without arguments echoes empty text");
}

static bool test_tool_name_missing() {
    test_helpers::Fixture fixture;
    json response = fixture.call(R"({"jsonrpc":"2.0","id":12,"method":"tools/call","params":{"arguments":{}}})");
    bool success = true;
    success &= check_equal(response["error"]["code"], json_rpc::METHOD_NOT_FOUND, "tools/call without name yields -32601");
    success &= check_equal(response["error"]["message"], "Unknown tool: null", "missing name is reported as null");

    json numeric = fixture.call(R"({"jsonrpc":"2.0","id":12,"method":"tools/call","params":{"name":42}})");
    success &= check_equal(numeric["error"]["code"], json_rpc::METHOD_NOT_FOUND, "non-string name yields -32601");
    success &= check_equal(numeric["error"]["message"], "Unknown tool: 42", "non-string name is printed as JSON");
    return success;
}

static bool test_websocket_search_missing_query() {
    test_helpers::Fixture fixture;
    bool success = true;
    for (const char *arguments : {"{}", R"({"query":""})", R"({"query":null})"}) {
        json response = fixture.call(std::string(R"({"jsonrpc":"2.0","id":13,"method":"tools/call","params":{"name":"websocket_search","arguments":)") +
                                     arguments + "}}");
        success &= check(response["error"]["code"] == json_rpc::INVALID_PARAMS, std::string("websocket_search ") + arguments + " yields -32602");
        success &= check(response["error"]["message"].get<std::string>().find("'query'") != std::string::npos,
                         "message names the query parameter");
    }
    return success;
}

static bool test_tool_execution_error() {
    test_helpers::Fixture fixture;
    json response = fixture.call(
        R"({"jsonrpc":"2.0","id":14,"method":"tools/call","params":{"name":"add","arguments":{"a":"two","b":3}}})");
    bool success = true;
    success &= check_equal(response["error"]["code"], json_rpc::INTERNAL_ERROR, "tool failure yields -32603");
    success &= check(response["error"]["message"].get<std::string>().rfind("Tool execution error: ", 0) == 0,
                     "tool failure message starts with 'Tool execution error: '");
    return success;
}

// A registry whose only tool throws; the dispatcher must still answer.
static bool test_throwing_tool_is_contained() {
    server_config::ServerConfig config = server_config::stdio_defaults();
    mcp_tools::ToolRegistry registry({
        {"explode", "Always throws", json::object(), [](const json &) -> mcp_tools::ToolResult {
             throw std::runtime_error("boom");
         }},
    });
    mcp_dispatch::ServerContext context{config, registry};

    std::optional<std::string> response = mcp_dispatch::dispatch_text(
        R"({"jsonrpc":"2.0","id":"x","method":"tools/call","params":{"name":"explode"}})", context);
    json parsed = json::parse(*response);
    return check_equal(parsed["error"]["message"], "Tool execution error: boom", "exception text reaches the error message");
}

static bool test_method_table() {
    bool success = true;
    success &= check(mcp_dispatch::find_method_handler("initialize") != nullptr, "initialize has a handler");
    success &= check(mcp_dispatch::find_method_handler("tools/list") != nullptr, "tools/list has a handler");
    success &= check(mcp_dispatch::find_method_handler("tools/call") != nullptr, "tools/call has a handler");
    success &= check(mcp_dispatch::find_method_handler("prompts/list") == nullptr, "prompts/list has none");
    success &= check(mcp_dispatch::find_method_handler("notifications/initialized") == nullptr, "notifications have none");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_echo_call();
    all_passed &= test_add_call();
    all_passed &= test_unknown_tool();
    all_passed &= test_initialized_notification_is_silent();
    all_passed &= test_malformed_json();
    all_passed &= test_non_object_json();
    all_passed &= test_malformed_invalid_utf8();
    all_passed &= test_initialize();
    all_passed &= test_initialize_websocket_profile();
    all_passed &= test_tools_list();
    all_passed &= test_id_echo_types();
    all_passed &= test_unknown_method();
    all_passed &= test_missing_method();
    all_passed &= test_notifications_never_answered();
    all_passed &= test_notification_family_with_id();
    all_passed &= test_arguments_not_object();
    all_passed &= test_arguments_absent_defaults_to_empty();
    all_passed &= test_tool_name_missing();
    all_passed &= test_websocket_search_missing_query();
    all_passed &= test_tool_execution_error();
    all_passed &= test_throwing_tool_is_contained();
    all_passed &= test_method_table();
    return all_passed;
}

} // namespace test_dispatch
