#ifndef DOTMCPS_TOOL_RESULT_HPP
#define DOTMCPS_TOOL_RESULT_HPP

// Outcome of a tool call: Ok(text) or Error(kind, text).
// Both render to the same MCP shape (one text segment); the tag only decides isError.

#include <nlohmann/json.hpp>
#include <string>

namespace tool_result {

using json = nlohmann::json;

enum class ErrorKind {
    None,
    MissingArgument,
    UnknownTool,
    RepositoryUnavailable,
    FileNotFound,
    ReadFailure,
    ExecutionFailure,
};

struct ToolOutcome {
    ErrorKind error_kind = ErrorKind::None;
    std::string text;

    bool is_error() const { return error_kind != ErrorKind::None; }
};

ToolOutcome ok(std::string text);
ToolOutcome error(ErrorKind kind, std::string text);

// Stable lowercase name, used in debug logging.
const char *error_kind_name(ErrorKind kind);

// MCP tools/call result: {"content": [{"type": "text", "text": ...}], "isError": ...}.
// Text is sanitized to valid UTF-8 so serialization cannot fail.
json to_json(const ToolOutcome &outcome);

} // namespace tool_result

#endif // DOTMCPS_TOOL_RESULT_HPP
