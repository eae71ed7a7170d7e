#include "mcp/mcp_stdio.hpp"
#include "utils/debug_log.hpp"

// MCP stdio transport: reading JSON messages from an input stream and
// writing them to an output stream, one message per line.

namespace mcp_stdio {

bool is_blank_line(const std::string &line) {
    return line.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

StdioTransport::StdioTransport(std::istream &input, std::ostream &output)
    : input_(input), output_(output) {}

bool StdioTransport::next_message(std::string &output_message) {
    std::string line;
    while (std::getline(input_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank_line(line)) {
            continue;
        }
        output_message = std::move(line);
        return true;
    }

    // EOF reached (or the stream went bad) without another message.
    if (!input_.eof()) {
        debug_log::log("stdin read failed before EOF.");
    }
    return false;
}

bool StdioTransport::send_message(const std::string &message) {
    output_ << message << '\n';
    output_.flush();
    return static_cast<bool>(output_);
}

std::string StdioTransport::describe() const {
    return "stdio";
}

} // namespace mcp_stdio
