#ifndef TMCPS_MCP_WEBSOCKET_CONNECTION_HPP
#define TMCPS_MCP_WEBSOCKET_CONNECTION_HPP

// Per-connection WebSocket transport.
// The libwebsockets service thread feeds received frames in and drains
// outbound messages; the session worker thread consumes and produces through
// the MessageTransport interface. All members are safe to call from either side.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include "mcp/mcp_transport.hpp"

namespace mcp_websocket {

class WebSocketConnection : public mcp_transport::MessageTransport {
public:
    // Largest reassembled message accepted; bigger ones are discarded.
    static constexpr std::size_t kMaxMessageBytes = 16 * 1024 * 1024;

    // wake_service is called whenever the service thread has work to pick up
    // (outbound message queued, session finished). It must be thread-safe.
    WebSocketConnection(std::string peer_label, std::function<void()> wake_service);

    // --- service thread side ---

    // Feed one received chunk. message_end marks the last chunk of the last
    // fragment of a message. Text messages are queued for the session; binary
    // messages are dropped.
    void receive_chunk(const char *data, std::size_t length, bool is_binary, bool message_end);

    // Peer closed or the connection failed: wakes a waiting next_message()
    // and makes every later send_message() fail.
    void mark_closed();

    // Server shutdown: next_message() ends the stream once the already queued
    // messages have been consumed.
    void request_drain();

    // Pop the next outbound message. Returns false if none is queued.
    bool take_outbound(std::string &output_message);

    bool has_outbound() const;

    // True once the connection should be closed from our side: drain was
    // requested, the session is done and nothing is left to write.
    bool ready_to_close() const;

    // --- session side ---

    bool next_message(std::string &output_message) override;
    bool send_message(const std::string &message) override;
    std::string describe() const override;

    // Called by the worker after the session loop returned.
    void mark_session_finished();

    bool session_finished() const;
    std::size_t binary_messages_dropped() const;

private:
    const std::string peer_label_;
    const std::function<void()> wake_service_;

    mutable std::mutex mutex_;
    std::condition_variable inbound_condition_;
    std::deque<std::string> inbound_;
    std::deque<std::string> outbound_;

    // Reassembly of the message currently arriving.
    std::string partial_;
    bool in_message_ = false;
    bool partial_binary_ = false;
    bool partial_oversized_ = false;

    bool closed_ = false;
    bool drain_requested_ = false;
    bool session_finished_ = false;
    std::size_t binary_messages_dropped_ = 0;
};

} // namespace mcp_websocket

#endif // TMCPS_MCP_WEBSOCKET_CONNECTION_HPP
