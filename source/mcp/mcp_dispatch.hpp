#ifndef DOTMCPS_MCP_DISPATCH_HPP
#define DOTMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we answer with when the client asks for one we do not know.
static const char PROTOCOL_VERSION[] = "2024-11-05";

// Server info reported by initialize.
static const char SERVER_NAME[] = "dotfiles-server";
static const char SERVER_VERSION[] = "1.0.0";

// True for protocol versions the server accepts verbatim from the client.
bool is_supported_protocol_version(const std::string &version);

class Dispatcher {
public:
    explicit Dispatcher(const mcp_tools::ToolRegistry &registry) : registry_(registry) {}

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a null
    // json value for notifications and client responses (which require no response).
    json dispatch_message(const json &message) const;

private:
    json handle_initialize(const json &request_id, const json &params) const;
    json handle_tools_list(const json &request_id) const;
    json handle_tools_call(const json &request_id, const json &params) const;

    const mcp_tools::ToolRegistry &registry_;
};

} // namespace mcp_dispatch

#endif // DOTMCPS_MCP_DISPATCH_HPP
