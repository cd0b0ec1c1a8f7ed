#include "config/server_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>

namespace server_config {

RepositoryLocation location_for_home(const std::string &home_directory) {
    std::filesystem::path home_path(home_directory);

    RepositoryLocation location;
    location.git_directory = (home_path / DOTFILES_GIT_DIRECTORY_NAME).string();
    location.work_tree = home_path.string();
    return location;
}

std::optional<ServerConfig> load_default_config() {
    std::string home = platform::home_directory();
    if (home.empty()) {
        return std::nullopt;
    }

    ServerConfig config;
    config.location = location_for_home(home);
    debug_log::log("git dir: " + config.location.git_directory +
                   ", work tree: " + config.location.work_tree);
    return config;
}

} // namespace server_config
