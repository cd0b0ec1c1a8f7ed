#ifndef DOTMCPS_GIT_REPO_HPP
#define DOTMCPS_GIT_REPO_HPP

// Runs git subcommands against the dotfiles bare repository and its work tree.

#include <stdexcept>
#include <string>
#include <vector>

#include "config/server_config.hpp"

namespace git_repo {

// The git executable could not be located or started. A git process that
// runs and exits non-zero is not an ExecutionError.
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string &message) : std::runtime_error(message) {}
};

// Outcome of one git invocation.
struct CommandResult {
    int exit_status = -1;
    std::string standard_output;
    std::string standard_error;
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_status == 0; }
};

// ["--git-dir=<git dir>", "--work-tree=<work tree>", arguments...]
std::vector<std::string> build_git_arguments(const server_config::RepositoryLocation &location,
                                             const std::vector<std::string> &arguments);

// Run git with the repository overrides followed by arguments.
// Non-zero exit is returned, not thrown. Throws ExecutionError if git cannot be started.
CommandResult run_git(const server_config::ServerConfig &config,
                      const std::vector<std::string> &arguments);

} // namespace git_repo

#endif // DOTMCPS_GIT_REPO_HPP
