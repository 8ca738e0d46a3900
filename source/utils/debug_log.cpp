#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

namespace {

std::mutex output_mutex;

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool read_debug_flag() {
    const char *value = std::getenv("PAGEPILOT_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void write_line(const std::string &message) {
    // Several threads log (transport service thread, lookup workers); keep lines whole.
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[pagepilot] " << message << std::endl;
}

} // namespace

bool is_debug_enabled() {
    static const bool enabled = read_debug_flag();
    return enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(message);
}

void warn(const std::string &message) {
    write_line(message);
}

} // namespace debug_log
