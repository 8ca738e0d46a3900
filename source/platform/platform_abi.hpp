#ifndef PAGEPILOT_PLATFORM_ABI_HPP
#define PAGEPILOT_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The child's stdout and stderr go to /dev/null; it is reaped by kill_process().
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Wait (poll) until a file exists and is non-empty, up to timeout_milliseconds.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Ask a process to exit (SIGTERM), escalate to SIGKILL after grace_milliseconds,
// and reap it. Returns false if the process id is invalid or already gone.
bool kill_process(int process_id, int grace_milliseconds = 3000);

} // namespace platform

#endif // PAGEPILOT_PLATFORM_ABI_HPP
