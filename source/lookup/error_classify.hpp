#ifndef PAGEPILOT_ERROR_CLASSIFY_HPP
#define PAGEPILOT_ERROR_CLASSIFY_HPP

// Sorting failure messages into user-facing categories.

#include <string>

namespace error_classify {

enum class ErrorType {
    Timeout,
    Network,
    Blocked,
    Parse,
    Debugger,
    Unknown
};

// Case-insensitive keyword match on the message, first hit wins:
// timeout; net:: or network; captcha, blocked or 403; parse or json; debugger or attach.
ErrorType classify_error(const std::string &message);

// "TIMEOUT", "NETWORK", "BLOCKED", "PARSE", "DEBUGGER", "UNKNOWN".
const char *error_type_name(ErrorType type);

// Short message for a person, naming the source (e.g. "IPInfo took too long to respond").
std::string user_friendly_message(ErrorType type, const std::string &source);

} // namespace error_classify

#endif // PAGEPILOT_ERROR_CLASSIFY_HPP
