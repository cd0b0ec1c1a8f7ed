#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_list_dotfiles {
void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config);
}
namespace tool_get_dotfile_content {
void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config);
}

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry,
                        const server_config::ServerConfig &config) {
    tool_list_dotfiles::register_tool(registry, config);
    tool_get_dotfile_content::register_tool(registry, config);
}

} // namespace tool_handlers
