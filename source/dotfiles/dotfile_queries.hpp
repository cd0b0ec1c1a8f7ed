#ifndef DOTMCPS_DOTFILE_QUERIES_HPP
#define DOTMCPS_DOTFILE_QUERIES_HPP

// Read-only queries over the dotfiles repository: which files are tracked,
// and what a tracked file currently contains on disk.

#include <filesystem>
#include <string>
#include <vector>

#include "config/server_config.hpp"

namespace dotfile_queries {

enum class ListStatus {
    Ok,                    // git answered; files may still be empty
    RepositoryUnavailable, // git exited non-zero or timed out
};

struct TrackedFilesResult {
    ListStatus status = ListStatus::RepositoryUnavailable;
    std::vector<std::string> files;
    std::string detail; // git's stderr when status != Ok
};

enum class ReadStatus {
    Ok,
    NotFound,
    ReadFailure,
};

// text is the file content when status == Ok, otherwise the message shown to the caller.
struct FileContentResult {
    ReadStatus status = ReadStatus::ReadFailure;
    std::string text;
};

// "\r\n" and lone "\r" become "\n".
std::string normalize_newlines(const std::string &text);

// Split `git ls-files` output on newlines, trim each line, drop empty ones. Order kept.
std::vector<std::string> parse_file_list(const std::string &output);

// Files tracked by the repository, in git's order.
// Throws git_repo::ExecutionError if git cannot be started.
TrackedFilesResult list_tracked_files(const server_config::ServerConfig &config);

// Work tree joined with the relative form of dotfile_path (a leading '/' is dropped).
std::filesystem::path resolve_dotfile_path(const server_config::RepositoryLocation &location,
                                           const std::string &dotfile_path);

// Current on-disk content of a file under the work tree, validated as UTF-8,
// with line endings normalized to "\n". A path containing NUL is not found.
FileContentResult read_tracked_file(const server_config::RepositoryLocation &location,
                                    const std::string &dotfile_path);

} // namespace dotfile_queries

#endif // DOTMCPS_DOTFILE_QUERIES_HPP
