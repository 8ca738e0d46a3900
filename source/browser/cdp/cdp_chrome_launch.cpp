#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace cdp_chrome_launch {

namespace {

// Well-known Chrome executable names and paths on Linux.
const std::vector<std::string> kLinuxChromePaths = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

std::string normalize_browser_path(std::string browser_path) {
    while (!browser_path.empty() && browser_path[0] == '/') {
        browser_path.erase(0, 1);
    }
    if (browser_path.empty()) {
        return "";
    }
    return "/" + browser_path;
}

} // namespace

std::string find_chrome_executable() {
    const char *path_environment = std::getenv("PATH");
    for (const auto &candidate : kLinuxChromePaths) {
        if (candidate.find('/') != std::string::npos) {
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
            continue;
        }
        if (path_environment == nullptr) {
            continue;
        }
        std::istringstream path_stream(path_environment);
        std::string directory;
        while (std::getline(path_stream, directory, ':')) {
            if (directory.empty()) {
                continue;
            }
            std::string full_path = directory + "/" + candidate;
            if (std::filesystem::exists(full_path)) {
                return full_path;
            }
        }
    }
    return "";
}

ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const LaunchOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = options.executable_path.empty() ? find_chrome_executable()
                                                                   : options.executable_path;
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(port),
        "--user-data-dir=" + user_data_directory,
    };
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
    }
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-sync",
        "--disable-translate",
        "--mute-audio",
        "about:blank",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

int parse_devtools_active_port(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return -1;
    }

    std::istringstream line_stream(contents);
    std::string first_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return -1;
    }

    try {
        int port = std::stoi(first_line);
        if (port > 0 && port <= 65535) {
            return port;
        }
    } catch (const std::exception &) {
        debug_log::log("DevToolsActivePort first line is not a port: " + first_line);
    }
    return -1;
}

std::string read_devtools_browser_path(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return "";
    }
    std::istringstream line_stream(contents);
    std::string first_line;
    std::string second_line;
    std::getline(line_stream, first_line);
    std::getline(line_stream, second_line);
    return normalize_browser_path(second_line);
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    std::string path = normalize_browser_path(browser_path);
    if (path.empty()) {
        path = "/devtools/browser";
    }
    return "ws://127.0.0.1:" + std::to_string(port) + path;
}

ChromeLaunchResult launch_chrome(const LaunchOptions &options) {
    ChromeLaunchResult result;

    std::string profile_directory = "/tmp/pagepilot_chrome_profile_" + std::to_string(getpid());
    std::error_code filesystem_error;
    std::filesystem::create_directories(profile_directory, filesystem_error);
    if (filesystem_error) {
        result.error_message = "Cannot create profile directory " + profile_directory + ": " + filesystem_error.message();
        return result;
    }
    result.user_data_directory = profile_directory;

    // A stale port file from a previous run would point at a dead browser.
    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    std::filesystem::remove(active_port_file, filesystem_error);

    ChromeCommandLine command_line = build_chrome_command_line(profile_directory, 0, options);
    if (command_line.executable_path.empty()) {
        result.error_message = "Could not find Chrome executable on this system. "
                               "Install google-chrome or chromium, or set PAGEPILOT_CHROME.";
        return result;
    }

    debug_log::log("launch_chrome: " + command_line.executable_path);
    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path,
                                                                 command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn Chrome: " + spawn_result.error_message;
        return result;
    }
    result.process_id = spawn_result.process_id;

    if (!platform::wait_for_file(active_port_file, options.startup_timeout_milliseconds)) {
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        terminate_chrome(result);
        return result;
    }

    result.debug_port = parse_devtools_active_port(active_port_file);
    if (result.debug_port <= 0) {
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        terminate_chrome(result);
        return result;
    }

    result.websocket_debugger_url = build_websocket_url(result.debug_port,
                                                        read_devtools_browser_path(active_port_file));
    debug_log::log("launch_chrome: pid=" + std::to_string(result.process_id) +
                   " url=" + result.websocket_debugger_url);
    result.success = true;
    return result;
}

void terminate_chrome(ChromeLaunchResult &launch_result) {
    if (launch_result.process_id > 0) {
        debug_log::log("terminate_chrome: pid=" + std::to_string(launch_result.process_id));
        platform::kill_process(launch_result.process_id);
        launch_result.process_id = -1;
    }
    if (!launch_result.user_data_directory.empty()) {
        std::error_code filesystem_error;
        std::filesystem::remove_all(launch_result.user_data_directory, filesystem_error);
        if (filesystem_error) {
            debug_log::log("terminate_chrome: profile not removed: " + filesystem_error.message());
        }
        launch_result.user_data_directory.clear();
    }
}

} // namespace cdp_chrome_launch
