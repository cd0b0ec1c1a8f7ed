#ifndef DOTMCPS_MCP_TOOLS_HPP
#define DOTMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "mcp/tool_result.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments object, returns the outcome.
using ToolHandler = std::function<tool_result::ToolOutcome(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Owns the tool set for one server. Filled once at startup, read-only afterwards.
class ToolRegistry {
public:
    // Register a tool. A later registration with the same name replaces the earlier one.
    void register_tool(const ToolDefinition &definition);

    // Registered tools in registration order.
    const std::vector<ToolDefinition> &tools() const { return tools_; }

    // Returns nullptr if no tool has that name.
    const ToolDefinition *find(const std::string &tool_name) const;

    // Build the response payload for tools/list.
    json build_tools_list_response() const;

    // Run the named tool. Unknown names and handler exceptions come back as error outcomes.
    tool_result::ToolOutcome dispatch(const std::string &tool_name, const json &arguments) const;

private:
    std::vector<ToolDefinition> tools_;
};

} // namespace mcp_tools

#endif // DOTMCPS_MCP_TOOLS_HPP
