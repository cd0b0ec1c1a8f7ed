// dotmcps – Dotfiles Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Exposes the dotfiles bare repository (~/.cfg, work tree ~) as read-only tools.
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (permitted by MCP spec).

#include <csignal>
#include <iostream>
#include <optional>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    std::cerr << "[dotmcps] dotmcps – Dotfiles MCP Server " << mcp_dispatch::SERVER_VERSION << std::endl;

    if (!mcp_stdio::install_signal_handlers(signal_handler)) {
        return 1;
    }

    std::optional<server_config::ServerConfig> config = server_config::load_default_config();
    if (!config) {
        debug_log::error("Cannot determine the home directory (HOME unset and no passwd entry).");
        return 1;
    }

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry, *config);
    mcp_dispatch::Dispatcher dispatcher(registry);

    mcp_stdio::log_message("Serving " + config->location.git_directory +
                           ". Waiting for MCP messages on stdin.");

    int handled_count = mcp_stdio::serve(std::cin, std::cout, dispatcher, &shutdown_requested);

    debug_log::log("Handled " + std::to_string(handled_count) + " message(s).");
    mcp_stdio::log_message("dotmcps shut down.");
    return 0;
}
