#ifndef TMCPS_MCP_WEBSOCKET_SERVER_HPP
#define TMCPS_MCP_WEBSOCKET_SERVER_HPP

// MCP WebSocket binding.
// libwebsockets accepts connections and runs the service loop on the calling
// thread; every established connection gets its own session worker thread.
// Sessions share only the read-only ServerContext.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_websocket_connection.hpp"

struct lws_context;
struct lws;

namespace mcp_websocket {

class WebSocketServer {
public:
    explicit WebSocketServer(const mcp_dispatch::ServerContext &context);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer &) = delete;
    WebSocketServer &operator=(const WebSocketServer &) = delete;

    // Create the libwebsockets context and start listening on the configured
    // host and port. Returns false (with error_detail) if that fails.
    bool start(std::string &error_detail);

    // Service connections until request_stop(), then stop accepting, let the
    // queued messages drain, close every connection and join the workers.
    void run();

    // Thread-safe. Wakes the service loop.
    void request_stop();

    // libwebsockets protocol callback entry point (not for direct use).
    int handle_callback(struct lws *websocket_instance, int reason, void *incoming_data, std::size_t incoming_length);

private:
    struct SessionWorker {
        std::shared_ptr<WebSocketConnection> connection;
        std::thread thread;
    };

    void on_established(struct lws *websocket_instance);
    void on_closed(struct lws *websocket_instance);
    int on_writeable(struct lws *websocket_instance);
    void on_service_woken();
    void join_finished_workers(bool join_all);

    const mcp_dispatch::ServerContext &context_;
    struct lws_context *websocket_context_ = nullptr;
    std::mutex context_mutex_; // guards websocket_context_ against request_stop()
    std::atomic<bool> stop_requested_{false};
    bool stopping_ = false;
    unsigned long next_connection_number_ = 1;

    // Only touched from the service thread.
    std::map<struct lws *, std::shared_ptr<WebSocketConnection>> open_connections_;
    std::vector<SessionWorker> workers_;
};

// Map the configured host to what libwebsockets accepts as a listen
// interface: "localhost" becomes 127.0.0.1, "" / "*" / "0.0.0.0" mean all
// interfaces (returned as empty string).
std::string listen_interface_for_host(const std::string &host);

} // namespace mcp_websocket

#endif // TMCPS_MCP_WEBSOCKET_SERVER_HPP
