#include "mcp/mcp_websocket_connection.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace mcp_websocket {

WebSocketConnection::WebSocketConnection(std::string peer_label, std::function<void()> wake_service)
    : peer_label_(std::move(peer_label)), wake_service_(std::move(wake_service)) {}

void WebSocketConnection::receive_chunk(const char *data, std::size_t length, bool is_binary, bool message_end) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!in_message_) {
        in_message_ = true;
        partial_binary_ = is_binary;
        partial_oversized_ = false;
        partial_.clear();
    }

    if (!partial_binary_ && !partial_oversized_) {
        if (partial_.size() + length > kMaxMessageBytes) {
            partial_oversized_ = true;
            partial_.clear();
            partial_.shrink_to_fit();
        } else {
            partial_.append(data, length);
        }
    }

    if (!message_end) {
        return;
    }
    in_message_ = false;

    if (partial_binary_) {
        binary_messages_dropped_++;
        lock.unlock();
        debug_log::log("Ignoring binary message on " + peer_label_ + ".");
        return;
    }
    if (partial_oversized_) {
        lock.unlock();
        debug_log::notice("Discarding message over " + std::to_string(kMaxMessageBytes) + " bytes on " +
                          peer_label_ + ".");
        return;
    }
    if (closed_ || drain_requested_) {
        return;
    }

    inbound_.push_back(std::move(partial_));
    partial_.clear();
    lock.unlock();
    inbound_condition_.notify_one();
}

void WebSocketConnection::mark_closed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        outbound_.clear();
    }
    inbound_condition_.notify_all();
}

void WebSocketConnection::request_drain() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_requested_ = true;
    }
    inbound_condition_.notify_all();
}

bool WebSocketConnection::take_outbound(std::string &output_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outbound_.empty()) {
        return false;
    }
    output_message = std::move(outbound_.front());
    outbound_.pop_front();
    return true;
}

bool WebSocketConnection::has_outbound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !outbound_.empty();
}

bool WebSocketConnection::ready_to_close() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drain_requested_ && session_finished_ && outbound_.empty();
}

bool WebSocketConnection::next_message(std::string &output_message) {
    std::unique_lock<std::mutex> lock(mutex_);
    inbound_condition_.wait(lock, [this]() {
        return !inbound_.empty() || closed_ || drain_requested_;
    });

    // A closed peer cannot receive replies, so queued messages are abandoned.
    if (closed_ || inbound_.empty()) {
        return false;
    }
    output_message = std::move(inbound_.front());
    inbound_.pop_front();
    return true;
}

bool WebSocketConnection::send_message(const std::string &message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        outbound_.push_back(message);
    }
    wake_service_();
    return true;
}

std::string WebSocketConnection::describe() const {
    return peer_label_;
}

void WebSocketConnection::mark_session_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_finished_ = true;
    }
    wake_service_();
}

bool WebSocketConnection::session_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_finished_;
}

std::size_t WebSocketConnection::binary_messages_dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binary_messages_dropped_;
}

} // namespace mcp_websocket
