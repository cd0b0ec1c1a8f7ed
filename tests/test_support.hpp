#ifndef DOTMCPS_TEST_SUPPORT_HPP
#define DOTMCPS_TEST_SUPPORT_HPP

// Shared helpers for the test suites: scratch directories, fixture files,
// a throwaway dotfiles repository, and OK/FAIL reporting.

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "config/server_config.hpp"
#include "git/git_repo.hpp"
#include "platform/platform_abi.hpp"

namespace test_support {

// Fresh directory under the system temp dir, removed with everything in it on destruction.
class TemporaryDirectory {
public:
    TemporaryDirectory() {
        std::string pattern = (std::filesystem::temp_directory_path() / "dotmcps_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) != nullptr) {
            path_ = buffer.data();
        }
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code remove_error;
            std::filesystem::remove_all(path_, remove_error);
        }
    }

    TemporaryDirectory(const TemporaryDirectory &) = delete;
    TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// Write contents verbatim (binary), creating parent directories.
inline void write_file(const std::string &path, const std::string &contents) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
}

// Config whose home directory is the given scratch directory; short git timeout.
inline server_config::ServerConfig config_for_home(const std::string &home) {
    server_config::ServerConfig config;
    config.location = server_config::location_for_home(home);
    config.git_timeout_milliseconds = 10000;
    return config;
}

inline bool git_available() {
    platform::ProcessResult result = platform::run_process("git", {"--version"}, 10000);
    return result.started && result.exit_status == 0;
}

// Create <home>/.cfg as a bare repository and stage the given work-tree files in it.
// Files must already exist under home. Returns false if any git step fails.
inline bool create_dotfiles_repository(const server_config::ServerConfig &config,
                                       const std::vector<std::string> &tracked_files) {
    platform::ProcessResult init_result = platform::run_process(
        "git", {"init", "--bare", "-q", config.location.git_directory}, 10000);
    if (!init_result.started || init_result.exit_status != 0) {
        std::cout << "  (git init failed: " << init_result.standard_error << ")" << std::endl;
        return false;
    }
    if (tracked_files.empty()) {
        return true;
    }

    std::vector<std::string> add_arguments = {"add", "--"};
    add_arguments.insert(add_arguments.end(), tracked_files.begin(), tracked_files.end());
    git_repo::CommandResult add_result = git_repo::run_git(config, add_arguments);
    if (!add_result.succeeded()) {
        std::cout << "  (git add failed: " << add_result.standard_error << ")" << std::endl;
        return false;
    }
    return true;
}

// Print an OK/FAIL line for one check and pass the verdict through.
inline bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

// Like report(), but on failure also shows the expected and actual strings.
inline bool report_equal(const std::string &actual, const std::string &expected,
                         const std::string &description) {
    bool success = (actual == expected);
    report(success, description);
    if (!success) {
        std::cout << "    expected: \"" << expected << "\"" << std::endl;
        std::cout << "    actual:   \"" << actual << "\"" << std::endl;
    }
    return success;
}

} // namespace test_support

#endif // DOTMCPS_TEST_SUPPORT_HPP
