#ifndef DOTMCPS_MCP_STDIO_HPP
#define DOTMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on stdin, responses out on stdout.
// Logs go to stderr (permitted by MCP spec).

#include <csignal>
#include <iosfwd>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace mcp_stdio {

// Read a single complete JSON object from input. Text starting with anything
// other than '{' is returned up to the end of its line.
// Returns the raw message, or empty string on EOF before a complete message.
std::string read_message(std::istream &input);

// Write a JSON message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Write a log message to stderr, regardless of DOTMCPS_DEBUG.
void log_message(const std::string &message);

// Route SIGINT and SIGTERM to handler without SA_RESTART, so a blocking read
// on stdin is interrupted and serve() returns. Returns false if sigaction fails.
bool install_signal_handlers(void (*handler)(int));

// Main message loop: read, dispatch, write, until EOF or *shutdown_requested
// becomes non-zero (checked between messages). Returns the number of messages handled.
int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher,
          const volatile std::sig_atomic_t *shutdown_requested);

} // namespace mcp_stdio

#endif // DOTMCPS_MCP_STDIO_HPP
