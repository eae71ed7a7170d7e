#include "config/server_config.hpp"

#include <cstdlib>

namespace server_config {

static const char *read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

ServerConfig stdio_defaults() {
    ServerConfig config;
    config.transport = TransportKind::stdio;
    config.server_name = "python-test-server";
    config.server_version = "1.0.0";
    config.protocol_version = "2025-03-26";
    config.tools_list_changed = true;
    return config;
}

ServerConfig websocket_defaults() {
    ServerConfig config;
    config.transport = TransportKind::websocket;
    config.server_name = "websocket-demo-mcp-server";
    config.server_version = "1.0.0";
    config.protocol_version = "2024-11-05";
    config.tools_list_changed = false;
    config.host = "localhost";
    config.port = 8765;
    return config;
}

bool parse_transport(const std::string &word, TransportKind &output_kind) {
    if (word == "stdio") {
        output_kind = TransportKind::stdio;
        return true;
    }
    if (word == "websocket" || word == "ws") {
        output_kind = TransportKind::websocket;
        return true;
    }
    return false;
}

bool parse_port(const std::string &text, int &output_port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char character : text) {
        if (character < '0' || character > '9') {
            return false;
        }
    }
    int port = std::stoi(text);
    if (port < 1 || port > 65535) {
        return false;
    }
    output_port = port;
    return true;
}

ConfigResult load(const std::vector<std::string> &arguments) {
    ConfigResult config_result;

    TransportKind transport = TransportKind::stdio;
    if (!arguments.empty()) {
        if (!parse_transport(arguments[0], transport)) {
            config_result.error_detail = "Unknown transport '" + arguments[0] + "' (expected stdio or websocket)";
            return config_result;
        }
    }
    if (arguments.size() > 1) {
        config_result.error_detail = "Unexpected argument '" + arguments[1] + "'";
        return config_result;
    }

    ServerConfig config = (transport == TransportKind::websocket) ? websocket_defaults() : stdio_defaults();

    if (const char *host = read_environment("TMCPS_HOST")) {
        config.host = host;
    }
    if (const char *port_text = read_environment("TMCPS_PORT")) {
        if (!parse_port(port_text, config.port)) {
            config_result.error_detail = std::string("Invalid TMCPS_PORT '") + port_text + "'";
            return config_result;
        }
    }
    if (const char *protocol_version = read_environment("TMCPS_PROTOCOL_VERSION")) {
        config.protocol_version = protocol_version;
    }

    config_result.config = config;
    config_result.success = true;
    return config_result;
}

std::string describe(const ServerConfig &config) {
    std::string summary = config.server_name + " " + config.server_version +
                          ", protocol " + config.protocol_version;
    if (config.transport == TransportKind::websocket) {
        summary += ", websocket ws://" + config.host + ":" + std::to_string(config.port);
    } else {
        summary += ", stdio";
    }
    return summary;
}

} // namespace server_config
