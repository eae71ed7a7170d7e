// TMCPS – Test MCP Server
// Entry point: minimal, deterministic MCP server for client conformance tests.
//
// Usage: tmcps [stdio|websocket]
//   stdio      JSON-RPC 2.0 messages, one per line, on stdin/stdout (default).
//   websocket  one message per text frame on ws://TMCPS_HOST:TMCPS_PORT.
// Logs go to stderr; stdout carries protocol messages only.

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_session.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_websocket_server.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Set from the signal handler, polled by the main thread.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// The session blocks in std::getline, so it runs on its own thread while the
// main thread watches for an interrupt.
static int run_stdio(const mcp_dispatch::ServerContext &context) {
    mcp_stdio::StdioTransport transport(std::cin, std::cout);

    std::packaged_task<mcp_session::TerminationReason()> session_task([&transport, &context]() {
        mcp_session::ServerSession session(transport, context);
        return session.run();
    });
    std::future<mcp_session::TerminationReason> session_result = session_task.get_future();
    std::thread session_thread(std::move(session_task));

    debug_log::notice("Waiting for MCP messages on stdin.");

    while (session_result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (shutdown_requested) {
            // The reader cannot be unblocked portably; leave without running
            // static destructors under its feet.
            debug_log::notice("Interrupted. Shutting down.");
            std::cout.flush();
            session_thread.detach();
            std::quick_exit(0);
        }
    }
    session_thread.join();

    mcp_session::TerminationReason reason = session_result.get();
    debug_log::notice("MCP server shut down.");
    return (reason == mcp_session::TerminationReason::end_of_stream) ? 0 : 1;
}

static int run_websocket(const mcp_dispatch::ServerContext &context) {
    mcp_websocket::WebSocketServer server(context);

    std::string error_detail;
    if (!server.start(error_detail)) {
        debug_log::notice(error_detail);
        return 1;
    }

    // lws_service() is not interrupted reliably by signals; relay the flag.
    std::promise<void> service_done;
    std::future<void> service_done_future = service_done.get_future();
    std::thread signal_watcher([&server, &service_done_future]() {
        while (service_done_future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (shutdown_requested) {
                debug_log::notice("Interrupted. Shutting down.");
                server.request_stop();
                return;
            }
        }
    });

    server.run();
    service_done.set_value();
    signal_watcher.join();
    return 0;
}

int main(int argc, char **argv) {
    std::cerr << "[tmcps] tmcps – Test MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    std::vector<std::string> arguments(argv + 1, argv + argc);
    server_config::ConfigResult config_result = server_config::load(arguments);
    if (!config_result.success) {
        std::cerr << "[tmcps] " << config_result.error_detail << std::endl;
        std::cerr << "[tmcps] Usage: tmcps [stdio|websocket]" << std::endl;
        return 2;
    }
    const server_config::ServerConfig config = config_result.config;

    const mcp_tools::ToolRegistry registry = tool_handlers::build_registry();
    const mcp_dispatch::ServerContext context{config, registry};

    debug_log::notice("Starting " + server_config::describe(config) + " with " +
                      std::to_string(registry.list().size()) + " tools.");

    if (config.transport == server_config::TransportKind::websocket) {
        return run_websocket(context);
    }
    return run_stdio(context);
}
