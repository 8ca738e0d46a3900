// Tests for reading settings from PAGEPILOT_* environment variables.

#include "config/settings.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace test_settings {

static void clear_environment() {
    for (const char *name : {"PAGEPILOT_WS_URL", "PAGEPILOT_CHROME", "PAGEPILOT_HEADLESS",
                             "PAGEPILOT_NAVIGATION_TIMEOUT_MS", "PAGEPILOT_SETTLE_MS",
                             "PAGEPILOT_SELECTOR_TIMEOUT_MS"}) {
        unsetenv(name);
    }
}

// Test: with nothing set, the documented defaults apply.
static bool test_defaults() {
    clear_environment();
    settings::Settings loaded = settings::load_from_environment();
    bool success = loaded.websocket_url.empty() && loaded.chrome_executable.empty() && loaded.headless &&
                   loaded.navigation_timeout_milliseconds == 30000 && loaded.settle_milliseconds == 500 &&
                   loaded.selector_timeout_milliseconds == 10000;
    if (success) {
        std::cout << "  OK: Defaults are 30000 ms navigation, 500 ms settle, 10000 ms selector, headless" << std::endl;
    } else {
        std::cout << "  FAIL: Defaults not as documented" << std::endl;
    }
    return success;
}

// Test: environment values override the defaults; malformed numbers are ignored.
static bool test_environment_overrides() {
    clear_environment();
    setenv("PAGEPILOT_WS_URL", "ws://127.0.0.1:9222/devtools/browser/abc", 1);
    setenv("PAGEPILOT_HEADLESS", "off", 1);
    setenv("PAGEPILOT_NAVIGATION_TIMEOUT_MS", "45000", 1);
    setenv("PAGEPILOT_SETTLE_MS", "-5", 1);
    setenv("PAGEPILOT_SELECTOR_TIMEOUT_MS", "2500ms", 1);
    settings::Settings loaded = settings::load_from_environment();
    clear_environment();

    bool success = loaded.websocket_url == "ws://127.0.0.1:9222/devtools/browser/abc" && !loaded.headless &&
                   loaded.navigation_timeout_milliseconds == 45000 && loaded.settle_milliseconds == 500 &&
                   loaded.selector_timeout_milliseconds == 10000;
    if (success) {
        std::cout << "  OK: Environment overrides applied, malformed values ignored" << std::endl;
    } else {
        std::cout << "  FAIL: ws=" << loaded.websocket_url << " headless=" << loaded.headless
                  << " nav=" << loaded.navigation_timeout_milliseconds << " settle=" << loaded.settle_milliseconds
                  << " selector=" << loaded.selector_timeout_milliseconds << std::endl;
    }
    return success;
}

// Test: flag and number parsing.
static bool test_parsers() {
    bool success = settings::parse_flag("YES", false) && !settings::parse_flag("0", true) &&
                   settings::parse_flag("maybe", true) && !settings::parse_flag("maybe", false) &&
                   settings::parse_milliseconds("250", 1) == 250 && settings::parse_milliseconds("", 7) == 7 &&
                   settings::parse_milliseconds("99999999999999", 7) == 7 &&
                   settings::parse_milliseconds("1.5", 7) == 7;
    if (success) {
        std::cout << "  OK: parse_flag and parse_milliseconds accept and reject as expected" << std::endl;
    } else {
        std::cout << "  FAIL: parser mismatch" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_environment_overrides();
    all_passed &= test_parsers();
    return all_passed;
}

} // namespace test_settings
