#include "mcp/mcp_session.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <optional>
#include <stdexcept>

namespace mcp_session {

const char *to_string(SessionState state) {
    switch (state) {
    case SessionState::ready:
        return "ready";
    case SessionState::running:
        return "running";
    case SessionState::terminated:
        return "terminated";
    }
    return "unknown";
}

const char *to_string(TerminationReason reason) {
    switch (reason) {
    case TerminationReason::none:
        return "none";
    case TerminationReason::end_of_stream:
        return "end of stream";
    case TerminationReason::receive_failed:
        return "receive failed";
    case TerminationReason::send_failed:
        return "send failed";
    }
    return "unknown";
}

ServerSession::ServerSession(mcp_transport::MessageTransport &transport, const mcp_dispatch::ServerContext &context)
    : transport_(transport), context_(context) {}

TerminationReason ServerSession::run() {
    if (state_.load() != SessionState::ready) {
        throw std::logic_error("ServerSession::run() called twice");
    }
    state_ = SessionState::running;
    debug_log::log("Session started on " + transport_.describe());

    while (true) {
        std::string raw_message;
        try {
            if (!transport_.next_message(raw_message)) {
                return finish(TerminationReason::end_of_stream);
            }
        } catch (const std::exception &error) {
            debug_log::notice("Receive failed on " + transport_.describe() + ": " + error.what());
            return finish(TerminationReason::receive_failed);
        }

        messages_received_++;
        debug_log::log("<- " + utf8_sanitize::truncate_for_log(raw_message, 1024));

        std::optional<std::string> response;
        try {
            response = mcp_dispatch::dispatch_text(raw_message, context_);
        } catch (const std::exception &error) {
            // dispatch_text does not throw short of resource exhaustion; drop
            // this message and keep the session alive.
            debug_log::notice("Dropped message on " + transport_.describe() + ": " + error.what());
            continue;
        }

        if (!response) {
            continue;
        }

        debug_log::log("-> " + utf8_sanitize::truncate_for_log(*response, 1024));
        bool sent = false;
        try {
            sent = transport_.send_message(*response);
        } catch (const std::exception &error) {
            debug_log::notice("Send failed on " + transport_.describe() + ": " + error.what());
            return finish(TerminationReason::send_failed);
        }
        if (!sent) {
            debug_log::notice("Send failed on " + transport_.describe() + ": channel closed.");
            return finish(TerminationReason::send_failed);
        }
        responses_sent_++;
    }
}

TerminationReason ServerSession::finish(TerminationReason reason) {
    termination_reason_ = reason;
    state_ = SessionState::terminated;
    debug_log::notice("Session on " + transport_.describe() + " terminated (" + to_string(reason) + ") after " +
                      std::to_string(messages_received_) + " message(s), " +
                      std::to_string(responses_sent_) + " response(s).");
    return reason;
}

} // namespace mcp_session
