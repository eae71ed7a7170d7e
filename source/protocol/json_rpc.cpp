#include "protocol/json_rpc.hpp"
#include "utils/utf8_sanitize.hpp"

namespace json_rpc {

ParseResult parse_request(const std::string &raw_text) {
    ParseResult parse_result;

    try {
        parse_result.message = json::parse(raw_text);
    } catch (const json::parse_error &error) {
        parse_result.error_detail = utf8_sanitize::sanitized(error.what());
        return parse_result;
    }

    if (!parse_result.message.is_object()) {
        parse_result.message = nullptr;
        parse_result.error_detail = "request must be a JSON object";
        return parse_result;
    }

    parse_result.success = true;
    return parse_result;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = utf8_sanitize::sanitized(error_message);
    return response;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

std::string serialize(const json &envelope) {
    // Strings that did not pass through the parser may still carry bad bytes;
    // replace rather than throw.
    return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_rpc
