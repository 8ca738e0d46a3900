#ifndef PAGEPILOT_DRIVER_TYPES_HPP
#define PAGEPILOT_DRIVER_TYPES_HPP

// Result and option types shared by the CDP plumbing and the page session.
// Operations report failure through these structs instead of throwing:
// success is false and error_kind says which part of the pipeline gave up.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace browser_driver {

using json = nlohmann::json;

enum class ErrorKind {
    None,
    Attach,            // target creation / attach handshake / domain enable failed
    NotAttached,       // operation on a page that is not (or no longer) attached
    Protocol,          // remote side answered with an error payload
    Transport,         // channel to the browser is down
    Timeout,           // bounded event wait exceeded its deadline
    NavigationTimeout, // load signal did not arrive in time
    SelectorTimeout,   // selector did not appear in time
    Evaluation         // page script threw
};

// Stable text name of an error kind, e.g. "NavigationTimeoutError".
const char *error_kind_name(ErrorKind kind);

// Result of an operation that yields no value.
struct DriverResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;
    std::string error_detail;
};

// Result of one CDP command. error_payload holds the response "error" member
// when error_kind is Protocol.
struct CommandResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    json result = json::object();
    json error_payload;
    std::string error_detail;
};

// An unsolicited CDP notification. session_id is empty for browser-level events.
struct CdpEvent {
    std::string session_id;
    std::string method;
    json params = json::object();
};

// Result of waiting for an event.
struct EventResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    CdpEvent event;
    std::string error_detail;
};

// Result of Runtime.evaluate, unwrapped. value is null when the expression had no value.
struct EvaluateResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    json value;
    std::string error_detail;
};

// Result of a text read. found is false when the element (or attribute) is missing.
struct TextResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    bool found = false;
    std::string text;
    std::string error_detail;
};

struct TextListResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::vector<std::string> texts;
    std::string error_detail;
};

struct ExistsResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    bool exists = false;
    std::string error_detail;
};

// Which page lifecycle event ends a navigation.
enum class WaitUntil {
    Load,            // Page.loadEventFired
    DomContentLoaded // Page.domContentEventFired
};

struct NavigateOptions {
    int timeout_milliseconds = 30000;
    WaitUntil wait_until = WaitUntil::Load;
    // Pause after the load signal so client-side rendering can catch up.
    int settle_milliseconds = 500;
};

struct WaitOptions {
    int timeout_milliseconds = 10000;
    int interval_milliseconds = 100;
};

// Copies the failure fields of one result into another result type.
template <typename To, typename From>
To forward_failure(const From &from) {
    To to;
    to.success = false;
    to.error_kind = from.error_kind;
    to.error_detail = from.error_detail;
    return to;
}

} // namespace browser_driver

#endif // PAGEPILOT_DRIVER_TYPES_HPP
