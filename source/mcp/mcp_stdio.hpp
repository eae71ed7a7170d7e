#ifndef TMCPS_MCP_STDIO_HPP
#define TMCPS_MCP_STDIO_HPP

// MCP stdio transport: newline-delimited JSON over a byte stream pair.

#include <istream>
#include <ostream>
#include <string>

#include "mcp/mcp_transport.hpp"

namespace mcp_stdio {

class StdioTransport : public mcp_transport::MessageTransport {
public:
    // The streams must outlive the transport. Usually std::cin / std::cout.
    StdioTransport(std::istream &input, std::ostream &output);

    // Next non-blank line, without its terminator (a trailing '\r' is dropped too).
    bool next_message(std::string &output_message) override;

    // Writes message followed by '\n' and flushes immediately.
    bool send_message(const std::string &message) override;

    std::string describe() const override;

private:
    std::istream &input_;
    std::ostream &output_;
};

// True if line holds nothing but spaces, tabs and line terminators.
bool is_blank_line(const std::string &line);

} // namespace mcp_stdio

#endif // TMCPS_MCP_STDIO_HPP
