#ifndef DOTMCPS_PLATFORM_ABI_HPP
#define DOTMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Outcome of running a child process to completion.
struct ProcessResult {
    bool started = false;       // false if the executable could not be spawned
    bool timed_out = false;     // true if the child was killed after the deadline
    int exit_status = -1;       // exit code, or 128 + signal number if killed by a signal
    std::string standard_output;
    std::string standard_error;
    std::string error_message;  // set when !started
};

// Run an executable (looked up on PATH when the name has no '/') with the given
// arguments, stdin bound to /dev/null, in working_directory when non-empty.
// Captures stdout and stderr separately and blocks until the child exits or
// timeout_milliseconds elapses (0 = no limit).
ProcessResult run_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          int timeout_milliseconds,
                          const std::string &working_directory = "");

enum class ReadStatus {
    Ok,
    NotFound,
    Failed,
};

struct FileReadResult {
    ReadStatus status = ReadStatus::Failed;
    std::string contents;
    std::string error_message; // strerror text plus path, when status != Ok
};

// Read the entire contents of a regular file as raw bytes.
FileReadResult read_file_contents(const std::string &file_path);

// Home directory of the current user: $HOME, then the passwd entry.
// Returns empty string if neither is available.
std::string home_directory();

} // namespace platform

#endif // DOTMCPS_PLATFORM_ABI_HPP
