#ifndef DOTMCPS_SERVER_CONFIG_HPP
#define DOTMCPS_SERVER_CONFIG_HPP

// Process-wide configuration, built once in main() and passed down by reference.

#include <optional>
#include <string>

namespace server_config {

// Name of the bare repository directory under the home directory.
static const char DOTFILES_GIT_DIRECTORY_NAME[] = ".cfg";

// Default bound on a single git invocation.
static constexpr int DEFAULT_GIT_TIMEOUT_MILLISECONDS = 30000;

// Where the dotfiles live: bare repository metadata plus the work tree it tracks.
struct RepositoryLocation {
    std::string git_directory;
    std::string work_tree;
};

struct ServerConfig {
    RepositoryLocation location;
    std::string git_executable = "git";
    int git_timeout_milliseconds = DEFAULT_GIT_TIMEOUT_MILLISECONDS;
};

// <home>/.cfg and <home>.
RepositoryLocation location_for_home(const std::string &home_directory);

// Configuration for the current user. Empty if no home directory can be found.
std::optional<ServerConfig> load_default_config();

} // namespace server_config

#endif // DOTMCPS_SERVER_CONFIG_HPP
