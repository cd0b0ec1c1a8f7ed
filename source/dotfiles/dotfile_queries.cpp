#include "dotfiles/dotfile_queries.hpp"
#include "git/git_repo.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <sstream>
#include <system_error>
#include <utility>

namespace dotfile_queries {

static const char WHITESPACE[] = " \t\r\n\v\f";

static std::string trim(const std::string &text) {
    std::string::size_type first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    std::string::size_type last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

std::string normalize_newlines(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for (std::string::size_type index = 0; index < text.size(); index++) {
        char character = text[index];
        if (character == '\r') {
            result += '\n';
            if (index + 1 < text.size() && text[index + 1] == '\n') {
                index++;
            }
            continue;
        }
        result += character;
    }
    return result;
}

std::vector<std::string> parse_file_list(const std::string &output) {
    std::vector<std::string> files;
    std::istringstream line_stream(output);
    std::string line;
    while (std::getline(line_stream, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            files.push_back(std::move(trimmed));
        }
    }
    return files;
}

TrackedFilesResult list_tracked_files(const server_config::ServerConfig &config) {
    git_repo::CommandResult command_result = git_repo::run_git(config, {"ls-files"});

    TrackedFilesResult result;
    if (!command_result.succeeded()) {
        result.status = ListStatus::RepositoryUnavailable;
        result.detail = command_result.timed_out ? "git ls-files timed out"
                                                 : trim(command_result.standard_error);
        debug_log::log("list_tracked_files: repository unavailable: " + result.detail);
        return result;
    }

    result.status = ListStatus::Ok;
    result.files = parse_file_list(command_result.standard_output);
    debug_log::log("list_tracked_files: " + std::to_string(result.files.size()) + " file(s)");
    return result;
}

std::filesystem::path resolve_dotfile_path(const server_config::RepositoryLocation &location,
                                           const std::string &dotfile_path) {
    return std::filesystem::path(location.work_tree) /
           std::filesystem::path(dotfile_path).relative_path();
}

FileContentResult read_tracked_file(const server_config::RepositoryLocation &location,
                                    const std::string &dotfile_path) {
    FileContentResult result;

    // No filesystem path can contain NUL; the C APIs below would silently truncate at it.
    if (dotfile_path.find('\0') != std::string::npos) {
        result.status = ReadStatus::NotFound;
        result.text = "File not found: " + dotfile_path;
        return result;
    }

    std::filesystem::path full_path = resolve_dotfile_path(location, dotfile_path);

    // Any error from the existence check (e.g. an unreadable parent directory) counts as absent.
    std::error_code exists_error;
    if (!std::filesystem::exists(full_path, exists_error)) {
        result.status = ReadStatus::NotFound;
        result.text = "File not found: " + dotfile_path;
        return result;
    }

    platform::FileReadResult read_result = platform::read_file_contents(full_path.string());
    if (read_result.status == platform::ReadStatus::NotFound) {
        // Removed between the existence check and the open.
        result.status = ReadStatus::NotFound;
        result.text = "File not found: " + dotfile_path;
        return result;
    }
    if (read_result.status != platform::ReadStatus::Ok) {
        debug_log::log("read_tracked_file: " + read_result.error_message);
        result.status = ReadStatus::ReadFailure;
        result.text = "Error reading file: " + read_result.error_message;
        return result;
    }

    std::size_t invalid_offset = 0;
    if (!utf8::validate(read_result.contents, &invalid_offset)) {
        result.status = ReadStatus::ReadFailure;
        result.text = "Error reading file: invalid UTF-8 sequence at byte offset " +
                      std::to_string(invalid_offset) + " in '" + full_path.string() + "'";
        return result;
    }

    result.status = ReadStatus::Ok;
    result.text = normalize_newlines(read_result.contents);
    return result;
}

} // namespace dotfile_queries
