#ifndef TMCPS_JSON_RPC_HPP
#define TMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers: parsing of incoming message units,
// construction of result and error responses.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes. INVALID_REQUEST is defined for completeness;
// the server reports malformed envelopes as PARSE_ERROR.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Outcome of turning one raw message unit into a request envelope.
struct ParseResult {
    bool success = false;
    json message;              // the envelope (a JSON object) when success
    std::string error_detail;  // parser diagnostic when !success, UTF-8 clean
};

// Parse raw text into a request envelope. Fails when the text is not JSON or
// the top-level value is not an object.
ParseResult parse_request(const std::string &raw_text);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing or not an object.
json get_params(const json &message);

// Check if a message is a notification (no id member at all; "id": null is a call).
bool is_notification(const json &message);

// Serialize an outbound envelope as a single line of compact JSON.
std::string serialize(const json &envelope);

} // namespace json_rpc

#endif // TMCPS_JSON_RPC_HPP
