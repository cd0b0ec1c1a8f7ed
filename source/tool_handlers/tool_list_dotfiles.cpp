#include "tool_handlers/tool_handlers.hpp"
#include "dotfiles/dotfile_queries.hpp"
#include "git/git_repo.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

// Tool handler for "list_dotfiles".
// Lists every path tracked by the dotfiles repository, one per line.

static const char NO_DOTFILES_TEXT[] = "No dotfiles found or git repository not accessible.";

static tool_result::ToolOutcome handle_list_dotfiles(const server_config::ServerConfig &config,
                                                     const json &arguments) {
    (void)arguments;

    debug_log::log("list_dotfiles invoked");
    dotfile_queries::TrackedFilesResult list_result;
    try {
        list_result = dotfile_queries::list_tracked_files(config);
    } catch (const git_repo::ExecutionError &error) {
        debug_log::error(std::string("git executable could not be started: ") + error.what());
        return tool_result::error(tool_result::ErrorKind::ExecutionFailure,
                                  std::string("Error: git executable could not be started: ") + error.what());
    }

    if (list_result.files.empty()) {
        // Same text either way; only the tag tells an empty repository from a broken one.
        if (list_result.status == dotfile_queries::ListStatus::RepositoryUnavailable) {
            return tool_result::error(tool_result::ErrorKind::RepositoryUnavailable, NO_DOTFILES_TEXT);
        }
        return tool_result::ok(NO_DOTFILES_TEXT);
    }

    std::ostringstream text_stream;
    text_stream << "Found " << list_result.files.size() << " dotfiles:\n\n";
    for (size_t index = 0; index < list_result.files.size(); index++) {
        if (index > 0) {
            text_stream << "\n";
        }
        text_stream << list_result.files[index];
    }
    return tool_result::ok(text_stream.str());
}

namespace tool_list_dotfiles {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    // No parameters needed.

    registry.register_tool({
        "list_dotfiles",
        "List all dotfiles managed by the repository",
        input_schema,
        [&config](const json &arguments) { return handle_list_dotfiles(config, arguments); }
    });
}

} // namespace tool_list_dotfiles
