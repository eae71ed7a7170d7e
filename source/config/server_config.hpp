#ifndef TMCPS_SERVER_CONFIG_HPP
#define TMCPS_SERVER_CONFIG_HPP

// Process-wide server configuration.
// Built once in main() and never modified afterwards; everything downstream
// receives it by const reference.

#include <string>
#include <vector>

namespace server_config {

enum class TransportKind {
    stdio,
    websocket
};

struct ServerConfig {
    TransportKind transport = TransportKind::stdio;

    // initialize payload. The two reference deployments disagree on the
    // protocol version, so it is per-deployment data rather than a constant.
    std::string server_name;
    std::string server_version;
    std::string protocol_version;
    bool tools_list_changed = false;

    // websocket listen endpoint (unused for stdio).
    std::string host;
    int port = 0;
};

// Result of building the configuration from argv and the environment.
struct ConfigResult {
    bool success = false;
    ServerConfig config;
    std::string error_detail;
};

// Defaults of the line-delimited deployment.
ServerConfig stdio_defaults();

// Defaults of the socket deployment (localhost:8765).
ServerConfig websocket_defaults();

// Parse a transport word ("stdio" or "websocket"). Returns false if unknown.
bool parse_transport(const std::string &word, TransportKind &output_kind);

// Parse a TCP port (1..65535). Returns false if not a number or out of range.
bool parse_port(const std::string &text, int &output_port);

// Build the configuration: arguments[0] (if any) picks the transport, then
// TMCPS_HOST, TMCPS_PORT and TMCPS_PROTOCOL_VERSION override the defaults.
ConfigResult load(const std::vector<std::string> &arguments);

// Human-readable one-line summary for the startup log.
std::string describe(const ServerConfig &config);

} // namespace server_config

#endif // TMCPS_SERVER_CONFIG_HPP
