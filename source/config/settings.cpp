#include "config/settings.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace settings {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    return value == nullptr ? std::string() : std::string(value);
}

int read_milliseconds(const char *name, int fallback) {
    std::string value = read_environment(name);
    if (value.empty()) {
        return fallback;
    }
    int parsed = parse_milliseconds(value, -1);
    if (parsed < 0) {
        debug_log::log(std::string("Ignoring malformed ") + name + "=" + value);
        return fallback;
    }
    return parsed;
}

} // namespace

bool parse_flag(const std::string &text, bool fallback) {
    std::string normalized = to_lower(text);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return fallback;
}

int parse_milliseconds(const std::string &text, int fallback) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char character) { return std::isdigit(character) != 0; })) {
        return fallback;
    }
    try {
        return std::stoi(text);
    } catch (const std::out_of_range &) {
        return fallback;
    }
}

Settings load_from_environment() {
    Settings loaded;
    loaded.websocket_url = read_environment("PAGEPILOT_WS_URL");
    loaded.chrome_executable = read_environment("PAGEPILOT_CHROME");

    std::string headless = read_environment("PAGEPILOT_HEADLESS");
    if (!headless.empty()) {
        loaded.headless = parse_flag(headless, loaded.headless);
    }

    loaded.navigation_timeout_milliseconds =
        read_milliseconds("PAGEPILOT_NAVIGATION_TIMEOUT_MS", loaded.navigation_timeout_milliseconds);
    loaded.settle_milliseconds = read_milliseconds("PAGEPILOT_SETTLE_MS", loaded.settle_milliseconds);
    loaded.selector_timeout_milliseconds =
        read_milliseconds("PAGEPILOT_SELECTOR_TIMEOUT_MS", loaded.selector_timeout_milliseconds);
    return loaded;
}

} // namespace settings
