// Tests for subprocess execution and the git command wrapper.
// Argument-building tests need nothing installed; the rest run real processes
// (sh, sleep, git) in a scratch directory.

#include "git/git_repo.hpp"
#include "platform/platform_abi.hpp"
#include "test_support.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using test_support::report;

namespace test_git_repo {

// Test: repository overrides come first, caller arguments follow in order.
static bool test_build_git_arguments_order() {
    server_config::RepositoryLocation location = server_config::location_for_home("/home/alice");
    std::vector<std::string> arguments = git_repo::build_git_arguments(location, {"ls-files", "-z"});

    std::vector<std::string> expected = {
        "--git-dir=/home/alice/.cfg",
        "--work-tree=/home/alice",
        "ls-files",
        "-z",
    };
    return report(arguments == expected, "git arguments are --git-dir, --work-tree, then caller arguments");
}

// Test: stdout, stderr and exit status are captured separately.
static bool test_run_process_captures_streams() {
    platform::ProcessResult result = platform::run_process(
        "sh", {"-c", "echo out; echo err 1>&2; exit 3"}, 10000);
    bool success = result.started && !result.timed_out && result.exit_status == 3 &&
                   result.standard_output == "out\n" && result.standard_error == "err\n";
    if (!success) {
        std::cout << "    started=" << result.started << " exit=" << result.exit_status
                  << " stdout='" << result.standard_output << "' stderr='"
                  << result.standard_error << "' error='" << result.error_message << "'" << std::endl;
    }
    return report(success, "run_process captures stdout, stderr and exit status");
}

// Test: the child sees EOF on stdin instead of blocking on it.
static bool test_run_process_stdin_is_empty() {
    platform::ProcessResult result = platform::run_process("cat", {}, 10000);
    return report(result.started && !result.timed_out && result.exit_status == 0 &&
                  result.standard_output.empty(),
                  "Child process reads EOF from stdin");
}

// Test: a hung child is killed once the deadline passes.
static bool test_run_process_timeout_kills_child() {
    auto start_time = std::chrono::steady_clock::now();
    platform::ProcessResult result = platform::run_process("sleep", {"30"}, 300);
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    bool success = result.started && result.timed_out && result.exit_status == -1 &&
                   elapsed_milliseconds < 10000;
    return report(success, "Hung child killed after timeout (" + std::to_string(elapsed_milliseconds) + " ms)");
}

// Test: a child that closes its output and keeps running is still killed at the deadline.
static bool test_run_process_timeout_after_pipes_closed() {
    auto start_time = std::chrono::steady_clock::now();
    platform::ProcessResult result = platform::run_process(
        "sh", {"-c", "exec >&- 2>&-; sleep 30"}, 300);
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    bool success = result.started && result.timed_out && result.exit_status == -1 &&
                   elapsed_milliseconds < 10000;
    return report(success, "Child with closed pipes killed after timeout (" +
                           std::to_string(elapsed_milliseconds) + " ms)");
}

// Test: a missing executable is reported as not started.
static bool test_run_process_missing_executable() {
    platform::ProcessResult result = platform::run_process("dotmcps-no-such-program", {}, 1000);
    return report(!result.started && !result.error_message.empty(),
                  "Missing executable reported as not started");
}

// Test: run_git throws ExecutionError when the git executable cannot be started.
static bool test_run_git_missing_executable_throws() {
    test_support::TemporaryDirectory home;
    server_config::ServerConfig config = test_support::config_for_home(home.path());
    config.git_executable = "/nonexistent/bin/git";

    bool thrown = false;
    try {
        git_repo::run_git(config, {"ls-files"});
    } catch (const git_repo::ExecutionError &error) {
        thrown = (std::string(error.what()).find("/nonexistent/bin/git") != std::string::npos);
    }
    return report(thrown, "run_git throws ExecutionError naming the missing executable");
}

// Test: a missing repository is a non-zero exit, not an exception.
static bool test_run_git_missing_repository_is_nonzero_exit() {
    if (!test_support::git_available()) {
        std::cout << "  WARN: git not installed; skipping." << std::endl;
        return true;
    }
    test_support::TemporaryDirectory home;
    server_config::ServerConfig config = test_support::config_for_home(home.path());

    git_repo::CommandResult result = git_repo::run_git(config, {"ls-files"});
    return report(!result.succeeded() && result.exit_status != 0 && !result.standard_error.empty(),
                  "Missing repository gives non-zero exit with stderr");
}

// Test: git runs against the bare repository and sees files staged in the work tree.
static bool test_run_git_uses_bare_repository() {
    if (!test_support::git_available()) {
        std::cout << "  WARN: git not installed; skipping." << std::endl;
        return true;
    }
    test_support::TemporaryDirectory home;
    server_config::ServerConfig config = test_support::config_for_home(home.path());
    test_support::write_file(home.path() + "/.bashrc", "export X=1\n");
    if (!test_support::create_dotfiles_repository(config, {".bashrc"})) {
        return report(false, "Scratch dotfiles repository created");
    }

    git_repo::CommandResult result = git_repo::run_git(config, {"ls-files"});
    return report(result.succeeded() && result.standard_output == ".bashrc\n",
                  "git ls-files against the bare repository lists the staged file");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_build_git_arguments_order();
    all_passed &= test_run_process_captures_streams();
    all_passed &= test_run_process_stdin_is_empty();
    all_passed &= test_run_process_timeout_kills_child();
    all_passed &= test_run_process_timeout_after_pipes_closed();
    all_passed &= test_run_process_missing_executable();
    all_passed &= test_run_git_missing_executable_throws();
    all_passed &= test_run_git_missing_repository_is_nonzero_exit();
    all_passed &= test_run_git_uses_bare_repository();
    return all_passed;
}

} // namespace test_git_repo
