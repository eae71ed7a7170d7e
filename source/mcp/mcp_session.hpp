#ifndef TMCPS_MCP_SESSION_HPP
#define TMCPS_MCP_SESSION_HPP

// One server session: the read -> dispatch -> write loop over a transport.
// Messages are handled strictly in arrival order, one at a time.

#include <atomic>
#include <cstddef>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_transport.hpp"

namespace mcp_session {

enum class SessionState {
    ready,
    running,
    terminated
};

enum class TerminationReason {
    none,
    end_of_stream,   // EOF or peer closed the connection
    receive_failed,  // transport threw while reading
    send_failed      // transport refused or threw while writing
};

const char *to_string(SessionState state);
const char *to_string(TerminationReason reason);

class ServerSession {
public:
    // Neither argument is owned; both must outlive run().
    ServerSession(mcp_transport::MessageTransport &transport, const mcp_dispatch::ServerContext &context);

    ServerSession(const ServerSession &) = delete;
    ServerSession &operator=(const ServerSession &) = delete;

    // Run until the transport ends or fails. Protocol errors never stop the
    // loop; they are ordinary responses. Call once.
    TerminationReason run();

    SessionState state() const { return state_.load(); }
    TerminationReason termination_reason() const { return termination_reason_; }
    std::size_t messages_received() const { return messages_received_; }
    std::size_t responses_sent() const { return responses_sent_; }

private:
    TerminationReason finish(TerminationReason reason);

    mcp_transport::MessageTransport &transport_;
    const mcp_dispatch::ServerContext &context_;
    std::atomic<SessionState> state_{SessionState::ready};
    TerminationReason termination_reason_ = TerminationReason::none;
    std::size_t messages_received_ = 0;
    std::size_t responses_sent_ = 0;
};

} // namespace mcp_session

#endif // TMCPS_MCP_SESSION_HPP
