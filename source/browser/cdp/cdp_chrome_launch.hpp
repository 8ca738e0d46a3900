#ifndef PAGEPILOT_CDP_CHROME_LAUNCH_HPP
#define PAGEPILOT_CDP_CHROME_LAUNCH_HPP

// Chrome browser launch and port discovery via DevToolsActivePort file.

#include <string>
#include <vector>

namespace cdp_chrome_launch {

struct LaunchOptions {
    std::string executable_path; // empty = find_chrome_executable()
    bool headless = true;
    int startup_timeout_milliseconds = 15000;
};

// Result of launching Chrome and discovering the debug port.
struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory;
    std::string error_message;
};

struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// Build the command-line arguments for launching Chrome. Port 0 lets Chrome pick one
// and report it in DevToolsActivePort.
ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const LaunchOptions &options = LaunchOptions());

// Find the Chrome executable on the system (well-known Linux paths, then PATH).
std::string find_chrome_executable();

// Parse the DevToolsActivePort file to extract the debug port (first line).
// Returns -1 on failure.
int parse_devtools_active_port(const std::string &file_path);

// Second line of DevToolsActivePort, normalized to exactly one leading slash.
// Empty if the file has no second line.
std::string read_devtools_browser_path(const std::string &file_path);

// Build the WebSocket debugger URL from the port and browser path.
std::string build_websocket_url(int port, const std::string &browser_path);

// Launch Chrome with remote debugging in a fresh per-process profile.
ChromeLaunchResult launch_chrome(const LaunchOptions &options = LaunchOptions());

// Kill a Chrome started by launch_chrome() and remove its profile directory.
void terminate_chrome(ChromeLaunchResult &launch_result);

} // namespace cdp_chrome_launch

#endif // PAGEPILOT_CDP_CHROME_LAUNCH_HPP
