#ifndef TMCPS_MCP_TRANSPORT_HPP
#define TMCPS_MCP_TRANSPORT_HPP

// Transport abstraction.
// A transport turns a physical channel into discrete text message units
// (one JSON-RPC envelope each) and back. Implementations: StdioTransport
// (one unit per line) and WebSocketConnection (one unit per text frame).

#include <string>

namespace mcp_transport {

class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    // Block until the next message unit is available and store it in
    // output_message. Returns false at end of stream (EOF, connection closed).
    // May throw on an unrecoverable channel failure.
    virtual bool next_message(std::string &output_message) = 0;

    // Write one message unit. Returns false if the channel can no longer
    // carry output (broken pipe, connection gone).
    virtual bool send_message(const std::string &message) = 0;

    // Short label for log lines, e.g. "stdio" or "ws 127.0.0.1:51234".
    virtual std::string describe() const = 0;
};

} // namespace mcp_transport

#endif // TMCPS_MCP_TRANSPORT_HPP
