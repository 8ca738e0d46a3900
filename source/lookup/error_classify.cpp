#include "lookup/error_classify.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace error_classify {

namespace {

bool contains_any(const std::string &haystack, std::initializer_list<const char *> needles) {
    for (const char *needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

ErrorType classify_error(const std::string &message) {
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    if (contains_any(lowered, {"timeout"})) return ErrorType::Timeout;
    if (contains_any(lowered, {"net::", "network"})) return ErrorType::Network;
    if (contains_any(lowered, {"captcha", "blocked", "403"})) return ErrorType::Blocked;
    if (contains_any(lowered, {"parse", "json"})) return ErrorType::Parse;
    if (contains_any(lowered, {"debugger", "attach"})) return ErrorType::Debugger;
    return ErrorType::Unknown;
}

const char *error_type_name(ErrorType type) {
    switch (type) {
    case ErrorType::Timeout:
        return "TIMEOUT";
    case ErrorType::Network:
        return "NETWORK";
    case ErrorType::Blocked:
        return "BLOCKED";
    case ErrorType::Parse:
        return "PARSE";
    case ErrorType::Debugger:
        return "DEBUGGER";
    case ErrorType::Unknown:
        break;
    }
    return "UNKNOWN";
}

std::string user_friendly_message(ErrorType type, const std::string &source) {
    switch (type) {
    case ErrorType::Timeout:
        return source + " took too long to respond";
    case ErrorType::Network:
        return "Could not connect to " + source;
    case ErrorType::Blocked:
        return source + " is blocking automated access";
    case ErrorType::Parse:
        return "Failed to read " + source + " data";
    case ErrorType::Debugger:
        return "Browser automation failed - try restarting the browser";
    case ErrorType::Unknown:
        break;
    }
    return source + " lookup failed";
}

} // namespace error_classify
