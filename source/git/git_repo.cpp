#include "git/git_repo.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace git_repo {

std::vector<std::string> build_git_arguments(const server_config::RepositoryLocation &location,
                                             const std::vector<std::string> &arguments) {
    std::vector<std::string> git_arguments = {
        "--git-dir=" + location.git_directory,
        "--work-tree=" + location.work_tree,
    };
    git_arguments.insert(git_arguments.end(), arguments.begin(), arguments.end());
    return git_arguments;
}

CommandResult run_git(const server_config::ServerConfig &config,
                      const std::vector<std::string> &arguments) {
    std::vector<std::string> git_arguments = build_git_arguments(config.location, arguments);

    std::string command_summary = config.git_executable;
    for (const auto &argument : git_arguments) {
        command_summary += " " + argument;
    }
    debug_log::log("run_git: " + command_summary);

    // Run from the work tree root so pathspecs and output paths are relative to it.
    // A missing work tree is left for git to report, not treated as a spawn failure.
    std::error_code directory_error;
    std::string working_directory;
    if (std::filesystem::is_directory(config.location.work_tree, directory_error)) {
        working_directory = config.location.work_tree;
    }
    platform::ProcessResult process_result = platform::run_process(
        config.git_executable, git_arguments, config.git_timeout_milliseconds,
        working_directory);

    if (!process_result.started) {
        throw ExecutionError(process_result.error_message);
    }

    CommandResult result;
    result.exit_status = process_result.exit_status;
    result.standard_output = std::move(process_result.standard_output);
    result.standard_error = std::move(process_result.standard_error);
    result.timed_out = process_result.timed_out;

    if (result.timed_out) {
        debug_log::log("run_git: killed after " +
                       std::to_string(config.git_timeout_milliseconds) + " ms");
    } else {
        debug_log::log("run_git: exit status " + std::to_string(result.exit_status));
    }
    return result;
}

} // namespace git_repo
