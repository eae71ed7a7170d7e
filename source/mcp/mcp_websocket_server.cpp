#include "mcp/mcp_websocket_server.hpp"
#include "mcp/mcp_session.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <cstring>
#include <vector>

namespace mcp_websocket {

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                               void *user_data, void *incoming_data, size_t incoming_length) {
    switch (reason) {
    case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION:
    case LWS_CALLBACK_ESTABLISHED:
    case LWS_CALLBACK_RECEIVE:
    case LWS_CALLBACK_SERVER_WRITEABLE:
    case LWS_CALLBACK_CLOSED:
    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        WebSocketServer *server = static_cast<WebSocketServer *>(lws_context_user(lws_get_context(websocket_instance)));
        if (server == nullptr) {
            return 0;
        }
        return server->handle_callback(websocket_instance, static_cast<int>(reason), incoming_data, incoming_length);
    }
    default:
        // Plain HTTP requests and the rest of the lifecycle get the stock handling.
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
}

// WebSocket protocol definition for libwebsockets. Clients that ask for no
// subprotocol get the first entry.
static const struct lws_protocols websocket_protocols[] = {
    {
        "mcp",
        websocket_callback,
        0,    // per-session data size; connections are looked up by wsi
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

std::string listen_interface_for_host(const std::string &host) {
    if (host.empty() || host == "*" || host == "0.0.0.0") {
        return "";
    }
    if (host == "localhost") {
        return "127.0.0.1";
    }
    return host;
}

WebSocketServer::WebSocketServer(const mcp_dispatch::ServerContext &context)
    : context_(context) {}

WebSocketServer::~WebSocketServer() {
    if (websocket_context_ != nullptr) {
        for (auto &entry : open_connections_) {
            entry.second->mark_closed();
        }
        join_finished_workers(true);
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
    }
}

bool WebSocketServer::start(std::string &error_detail) {
    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    std::string listen_interface = listen_interface_for_host(context_.config.host);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = context_.config.port;
    context_info.iface = listen_interface.empty() ? nullptr : listen_interface.c_str();
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        error_detail = "Failed to create libwebsockets context listening on " + context_.config.host + ":" +
                       std::to_string(context_.config.port);
        return false;
    }

    debug_log::notice("WebSocket MCP server ready at ws://" + context_.config.host + ":" +
                      std::to_string(context_.config.port));
    return true;
}

void WebSocketServer::run() {
    if (websocket_context_ == nullptr) {
        return;
    }

    while (!stop_requested_.load()) {
        if (lws_service(websocket_context_, 50) < 0) {
            debug_log::notice("lws_service failed; stopping WebSocket server.");
            break;
        }
    }

    // Stop accepting, let every session finish what it already received.
    stopping_ = true;
    debug_log::notice("Stopping: draining " + std::to_string(open_connections_.size()) + " connection(s).");
    for (auto &entry : open_connections_) {
        entry.second->request_drain();
    }
    while (!open_connections_.empty()) {
        if (lws_service(websocket_context_, 50) < 0) {
            break;
        }
    }
    for (auto &entry : open_connections_) {
        entry.second->mark_closed();
    }
    open_connections_.clear();

    join_finished_workers(true);
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
    }
    debug_log::notice("WebSocket server shut down.");
}

void WebSocketServer::request_stop() {
    stop_requested_ = true;
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (websocket_context_ != nullptr) {
        lws_cancel_service(websocket_context_);
    }
}

int WebSocketServer::handle_callback(struct lws *websocket_instance, int reason, void *incoming_data,
                                     std::size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION:
        // Non-zero rejects the handshake.
        return stopping_ ? 1 : 0;

    case LWS_CALLBACK_ESTABLISHED:
        on_established(websocket_instance);
        break;

    case LWS_CALLBACK_RECEIVE: {
        auto connection_iterator = open_connections_.find(websocket_instance);
        if (connection_iterator == open_connections_.end()) {
            break;
        }
        bool message_end = lws_is_final_fragment(websocket_instance) &&
                           lws_remaining_packet_payload(websocket_instance) == 0;
        connection_iterator->second->receive_chunk(static_cast<const char *>(incoming_data), incoming_length,
                                                   lws_frame_is_binary(websocket_instance) != 0, message_end);
        break;
    }

    case LWS_CALLBACK_SERVER_WRITEABLE:
        return on_writeable(websocket_instance);

    case LWS_CALLBACK_CLOSED:
        on_closed(websocket_instance);
        break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        on_service_woken();
        break;

    default:
        break;
    }
    return 0;
}

void WebSocketServer::on_established(struct lws *websocket_instance) {
    join_finished_workers(false);

    char address[128];
    address[0] = '\0';
    const char *peer_address = lws_get_peer_simple(websocket_instance, address, sizeof(address));
    std::string peer_label = "ws #" + std::to_string(next_connection_number_++) + " " +
                             (peer_address != nullptr ? peer_address : "unknown");

    struct lws_context *websocket_context = websocket_context_;
    auto connection = std::make_shared<WebSocketConnection>(peer_label, [websocket_context]() {
        lws_cancel_service(websocket_context);
    });

    open_connections_[websocket_instance] = connection;
    if (stopping_) {
        connection->request_drain();
    }

    debug_log::notice("Client connected: " + peer_label);

    SessionWorker worker;
    worker.connection = connection;
    const mcp_dispatch::ServerContext &context = context_;
    worker.thread = std::thread([connection, &context]() {
        mcp_session::ServerSession session(*connection, context);
        try {
            session.run();
        } catch (const std::exception &error) {
            debug_log::notice("Session on " + connection->describe() + " failed: " + error.what());
        }
        connection->mark_session_finished();
    });
    workers_.push_back(std::move(worker));
}

void WebSocketServer::on_closed(struct lws *websocket_instance) {
    auto connection_iterator = open_connections_.find(websocket_instance);
    if (connection_iterator == open_connections_.end()) {
        return;
    }
    debug_log::notice("Client disconnected: " + connection_iterator->second->describe());
    connection_iterator->second->mark_closed();
    open_connections_.erase(connection_iterator);
}

int WebSocketServer::on_writeable(struct lws *websocket_instance) {
    auto connection_iterator = open_connections_.find(websocket_instance);
    if (connection_iterator == open_connections_.end()) {
        return 0;
    }
    const std::shared_ptr<WebSocketConnection> &connection = connection_iterator->second;

    std::string message;
    if (!connection->take_outbound(message)) {
        // Returning -1 closes the connection once the drained session is done.
        return connection->ready_to_close() ? -1 : 0;
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + message.size());
    memcpy(send_buffer.data() + LWS_PRE, message.data(), message.size());

    int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
    if (bytes_written < static_cast<int>(message.size())) {
        debug_log::notice("Write failed on " + connection->describe() + "; closing.");
        return -1;
    }

    if (connection->has_outbound() || connection->ready_to_close()) {
        lws_callback_on_writable(websocket_instance);
    }
    return 0;
}

// Another thread called lws_cancel_service(): some connection has output
// queued or its session has ended.
void WebSocketServer::on_service_woken() {
    for (auto &entry : open_connections_) {
        if (entry.second->has_outbound() || entry.second->ready_to_close()) {
            lws_callback_on_writable(entry.first);
        }
    }
}

void WebSocketServer::join_finished_workers(bool join_all) {
    std::vector<SessionWorker> remaining_workers;
    for (auto &worker : workers_) {
        if (join_all || worker.connection->session_finished()) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        } else {
            remaining_workers.push_back(std::move(worker));
        }
    }
    workers_ = std::move(remaining_workers);
}

} // namespace mcp_websocket
