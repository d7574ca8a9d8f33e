// fsmcps – File-System Model Context Protocol Server
// Entry point: picks the transport and runs the MCP server loop.
//
// stdio mode reads JSON-RPC 2.0 messages from stdin and writes responses to stdout.
// SSE mode serves /sse, /messages/ and /health over HTTP.
// Logs go to stderr; stdout carries only protocol messages.

#include <csignal>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_sse.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main(int argc, char *argv[]) {
    config::ConfigResult loaded = config::load_from_process(argc, argv);
    if (!loaded.success) {
        std::cerr << "[fsmcps] " << loaded.error_message << std::endl;
        std::cerr << config::usage_text(argv[0]);
        return 2;
    }
    const config::ServerConfig &server_config = loaded.config;
    if (server_config.show_help) {
        std::cout << config::usage_text(argv[0]);
        return 0;
    }
    debug_log::set_debug_enabled(server_config.debug);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    debug_log::info("fsmcps – File-System MCP Server, transport " +
                    std::string(config::transport_name(server_config.transport)));
    debug_log::log(std::to_string(mcp_tools::list_tools().size()) + " tools available.");

    int exit_code = 0;
    if (server_config.transport == config::Transport::Sse) {
        exit_code = mcp_sse::run_server(server_config.host, server_config.port, shutdown_requested);
    } else {
        debug_log::info("Waiting for MCP messages on stdin.");
        int handled_count = mcp_stdio::run_loop(std::cin, std::cout, shutdown_requested);
        debug_log::log("Handled " + std::to_string(handled_count) + " messages.");
    }

    debug_log::info("fsmcps shut down.");
    return exit_code;
}
