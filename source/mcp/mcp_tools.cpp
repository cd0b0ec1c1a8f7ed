#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace mcp_tools {

void ToolRegistry::register_tool(const ToolDefinition &definition) {
    for (auto &tool : tools_) {
        if (tool.name == definition.name) {
            tool = definition;
            return;
        }
    }
    tools_.push_back(definition);
}

const ToolDefinition *ToolRegistry::find(const std::string &tool_name) const {
    for (const auto &tool : tools_) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

tool_result::ToolOutcome ToolRegistry::dispatch(const std::string &tool_name,
                                                const json &arguments) const {
    const ToolDefinition *tool = find(tool_name);
    if (tool == nullptr) {
        debug_log::log("Unknown tool requested: " + tool_name);
        return tool_result::error(tool_result::ErrorKind::UnknownTool, "Unknown tool: " + tool_name);
    }

    tool_result::ToolOutcome outcome;
    try {
        outcome = tool->handler(arguments);
    } catch (const std::exception &exception) {
        debug_log::error(tool_name + " failed: " + exception.what());
        return tool_result::error(tool_result::ErrorKind::ExecutionFailure,
                                  std::string("Error: ") + exception.what());
    }

    if (outcome.is_error()) {
        debug_log::log(tool_name + " -> " + tool_result::error_kind_name(outcome.error_kind));
    }
    return outcome;
}

} // namespace mcp_tools
