#ifndef PAGEPILOT_SETTINGS_HPP
#define PAGEPILOT_SETTINGS_HPP

// Runtime settings, read from PAGEPILOT_* environment variables.
// Command-line flags are applied on top by the caller. Nothing is persisted.

#include <string>

namespace settings {

struct Settings {
    // Browser-level DevTools WebSocket URL to connect to. Empty = launch Chrome.
    std::string websocket_url;
    // Chrome executable. Empty = search the well-known locations.
    std::string chrome_executable;
    bool headless = true;
    int navigation_timeout_milliseconds = 30000;
    int settle_milliseconds = 500;
    int selector_timeout_milliseconds = 10000;
    int connect_timeout_milliseconds = 20000;
};

// Defaults overridden by PAGEPILOT_WS_URL, PAGEPILOT_CHROME, PAGEPILOT_HEADLESS,
// PAGEPILOT_NAVIGATION_TIMEOUT_MS, PAGEPILOT_SETTLE_MS, PAGEPILOT_SELECTOR_TIMEOUT_MS.
// Malformed numbers keep the default and are reported through debug_log.
Settings load_from_environment();

// "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false.
// Anything else leaves fallback.
bool parse_flag(const std::string &text, bool fallback);

// Non-negative integer parse. Anything else leaves fallback.
int parse_milliseconds(const std::string &text, int fallback);

} // namespace settings

#endif // PAGEPILOT_SETTINGS_HPP
