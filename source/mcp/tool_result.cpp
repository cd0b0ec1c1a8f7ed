#include "mcp/tool_result.hpp"
#include "utils/utf8.hpp"

#include <utility>

namespace tool_result {

ToolOutcome ok(std::string text) {
    ToolOutcome outcome;
    outcome.text = std::move(text);
    return outcome;
}

ToolOutcome error(ErrorKind kind, std::string text) {
    ToolOutcome outcome;
    outcome.error_kind = kind;
    outcome.text = std::move(text);
    return outcome;
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::MissingArgument:
        return "missing_argument";
    case ErrorKind::UnknownTool:
        return "unknown_tool";
    case ErrorKind::RepositoryUnavailable:
        return "repository_unavailable";
    case ErrorKind::FileNotFound:
        return "file_not_found";
    case ErrorKind::ReadFailure:
        return "read_failure";
    case ErrorKind::ExecutionFailure:
        return "execution_failure";
    }
    return "unknown";
}

json to_json(const ToolOutcome &outcome) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = utf8::sanitize(outcome.text);

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = outcome.is_error();
    return result;
}

} // namespace tool_result
