#include "platform/platform_abi.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char **environ;

namespace platform {

namespace {

void close_if_open(int &file_descriptor) {
    if (file_descriptor >= 0) {
        close(file_descriptor);
        file_descriptor = -1;
    }
}

using Clock = std::chrono::steady_clock;

int exit_status_from(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int wait_for_child(pid_t child_pid) {
    int status = 0;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exit_status_from(status);
}

// Reaps the child if it exits before the deadline. Returns false if it is still running.
bool wait_for_child_until(pid_t child_pid, Clock::time_point deadline, int &exit_status) {
    while (true) {
        int status = 0;
        pid_t reaped = waitpid(child_pid, &status, WNOHANG);
        if (reaped == child_pid) {
            exit_status = exit_status_from(status);
            return true;
        }
        if (reaped < 0 && errno != EINTR) {
            exit_status = -1;
            return true;
        }
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

// Drains both pipes until EOF on each or until the deadline passes (when bounded).
// Returns false if the deadline passed or poll failed before both reached EOF.
bool drain_pipes(int &stdout_descriptor, int &stderr_descriptor,
                 std::string &standard_output, std::string &standard_error,
                 bool bounded, Clock::time_point deadline) {
    std::array<char, 4096> buffer{};

    struct pollfd descriptors[2];
    descriptors[0].fd = stdout_descriptor;
    descriptors[0].events = POLLIN;
    descriptors[1].fd = stderr_descriptor;
    descriptors[1].events = POLLIN;
    std::string *sinks[2] = {&standard_output, &standard_error};

    while (descriptors[0].fd >= 0 || descriptors[1].fd >= 0) {
        int wait_milliseconds = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            wait_milliseconds = static_cast<int>(remaining.count());
        }

        descriptors[0].revents = 0;
        descriptors[1].revents = 0;
        int ready = poll(descriptors, 2, wait_milliseconds);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (int index = 0; index < 2; index++) {
            if (descriptors[index].fd < 0 ||
                (descriptors[index].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t count = read(descriptors[index].fd, buffer.data(), buffer.size());
            if (count > 0) {
                sinks[index]->append(buffer.data(), static_cast<size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                close(descriptors[index].fd);
                descriptors[index].fd = -1;
            }
        }
    }

    stdout_descriptor = descriptors[0].fd;
    stderr_descriptor = descriptors[1].fd;
    return stdout_descriptor < 0 && stderr_descriptor < 0;
}

} // namespace

ProcessResult run_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          int timeout_milliseconds,
                          const std::string &working_directory) {
    ProcessResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_if_open(stdout_pipe[0]);
        close_if_open(stdout_pipe[1]);
        return result;
    }

    // argv: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
    if (!working_directory.empty()) {
        posix_spawn_file_actions_addchdir_np(&file_actions, working_directory.c_str());
    }

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable.c_str(), &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    // Write ends belong to the child now.
    close_if_open(stdout_pipe[1]);
    close_if_open(stderr_pipe[1]);

    if (spawn_status != 0) {
        close_if_open(stdout_pipe[0]);
        close_if_open(stderr_pipe[0]);
        result.error_message = "posix_spawn failed for '" + executable + "': " +
                               std::string(strerror(spawn_status));
        return result;
    }
    result.started = true;

    const bool bounded = timeout_milliseconds > 0;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    bool finished = drain_pipes(stdout_pipe[0], stderr_pipe[0],
                                result.standard_output, result.standard_error,
                                bounded, deadline);
    close_if_open(stdout_pipe[0]);
    close_if_open(stderr_pipe[0]);

    // The child may close its pipes and keep running; the deadline covers the wait too.
    if (finished && bounded) {
        int exit_status = -1;
        if (wait_for_child_until(child_pid, deadline, exit_status)) {
            result.exit_status = exit_status;
            return result;
        }
        finished = false;
    }

    if (!finished) {
        kill(child_pid, SIGKILL);
        wait_for_child(child_pid);
        result.timed_out = true;
        result.exit_status = -1;
        return result;
    }

    result.exit_status = wait_for_child(child_pid);
    return result;
}

FileReadResult read_file_contents(const std::string &file_path) {
    FileReadResult result;

    int file_descriptor = open(file_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file_descriptor < 0) {
        int error_number = errno;
        result.status = (error_number == ENOENT || error_number == ENOTDIR)
                            ? ReadStatus::NotFound
                            : ReadStatus::Failed;
        result.error_message = std::string(strerror(error_number)) + ": '" + file_path + "'";
        return result;
    }

    struct stat file_information;
    if (fstat(file_descriptor, &file_information) != 0) {
        int error_number = errno;
        close(file_descriptor);
        result.error_message = std::string(strerror(error_number)) + ": '" + file_path + "'";
        return result;
    }
    if (S_ISDIR(file_information.st_mode)) {
        close(file_descriptor);
        result.error_message = std::string(strerror(EISDIR)) + ": '" + file_path + "'";
        return result;
    }
    if (file_information.st_size > 0) {
        result.contents.reserve(static_cast<size_t>(file_information.st_size));
    }

    std::array<char, 65536> buffer{};
    while (true) {
        ssize_t count = read(file_descriptor, buffer.data(), buffer.size());
        if (count > 0) {
            result.contents.append(buffer.data(), static_cast<size_t>(count));
            continue;
        }
        if (count == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        int error_number = errno;
        close(file_descriptor);
        result.contents.clear();
        result.error_message = std::string(strerror(error_number)) + ": '" + file_path + "'";
        return result;
    }

    close(file_descriptor);
    result.status = ReadStatus::Ok;
    return result;
}

std::string home_directory() {
    const char *home_environment = std::getenv("HOME");
    if (home_environment != nullptr && home_environment[0] != '\0') {
        return home_environment;
    }
    struct passwd *password_entry = getpwuid(getuid());
    if (password_entry != nullptr && password_entry->pw_dir != nullptr) {
        return password_entry->pw_dir;
    }
    return "";
}

} // namespace platform
