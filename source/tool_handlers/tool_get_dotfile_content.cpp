#include "tool_handlers/tool_handlers.hpp"
#include "dotfiles/dotfile_queries.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

// Tool handler for "get_dotfile_content".
// Returns the current on-disk content of one file under the work tree.

static tool_result::ToolOutcome handle_get_dotfile_content(const server_config::ServerConfig &config,
                                                           const json &arguments) {
    std::string filepath;
    if (arguments.contains("filepath") && arguments["filepath"].is_string()) {
        filepath = arguments["filepath"].get<std::string>();
    }
    if (filepath.empty()) {
        return tool_result::error(tool_result::ErrorKind::MissingArgument, "Error: filepath is required");
    }

    debug_log::log("get_dotfile_content invoked, filepath=" + filepath);
    dotfile_queries::FileContentResult read_result =
        dotfile_queries::read_tracked_file(config.location, filepath);

    std::string text = "Content of " + filepath + ":\n\n" + read_result.text;
    switch (read_result.status) {
    case dotfile_queries::ReadStatus::Ok:
        return tool_result::ok(std::move(text));
    case dotfile_queries::ReadStatus::NotFound:
        return tool_result::error(tool_result::ErrorKind::FileNotFound, std::move(text));
    case dotfile_queries::ReadStatus::ReadFailure:
        break;
    }
    return tool_result::error(tool_result::ErrorKind::ReadFailure, std::move(text));
}

namespace tool_get_dotfile_content {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json filepath_property;
    filepath_property["type"] = "string";
    filepath_property["description"] = "Path to the dotfile";

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"]["filepath"] = filepath_property;
    input_schema["required"] = json::array({"filepath"});

    registry.register_tool({
        "get_dotfile_content",
        "Get the content of a specific dotfile",
        input_schema,
        [&config](const json &arguments) { return handle_get_dotfile_content(config, arguments); }
    });
}

} // namespace tool_get_dotfile_content
