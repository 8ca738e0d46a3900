#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    // posix_spawn wants a mutable, null-terminated argv.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, executable_path.c_str(),
                                    &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawnp failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    const auto poll_interval = std::chrono::milliseconds(100);

    while (true) {
        std::error_code filesystem_error;
        if (std::filesystem::exists(file_path, filesystem_error)) {
            // Chrome may create the file before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

bool kill_process(int process_id, int grace_milliseconds) {
    if (process_id <= 0) {
        return false;
    }
    pid_t pid = static_cast<pid_t>(process_id);
    if (kill(pid, SIGTERM) != 0) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || waited < 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    kill(pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
    return true;
}

} // namespace platform
