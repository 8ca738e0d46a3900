#ifndef PAGEPILOT_CDP_MESSAGE_HPP
#define PAGEPILOT_CDP_MESSAGE_HPP

// CDP wire helpers: building command frames and picking apart incoming frames.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace cdp_message {

using json = nlohmann::json;

// Build a CDP command frame. params is omitted when null or empty,
// sessionId is omitted when session_id is empty (browser-level command).
json build_command(int message_id, const std::string &method, const json &params,
                   const std::string &session_id = "");

// A frame with a non-null "id" is a response; a frame with "method" and no id is an event.
bool is_response(const json &message);
bool is_event(const json &message);

// Extract the id of a response. Returns -1 if missing or not an integer.
int get_id(const json &message);

// Extract the session id the frame is routed to. Returns empty for browser-level frames.
std::string get_session_id(const json &message);

// Extract method name of an event or command. Returns empty if missing.
std::string get_method(const json &message);

// Extract params of an event or command. Returns empty object if missing.
json get_params(const json &message);

// True if a response carries an "error" member.
bool has_error(const json &message);

// Human-readable text of a response error payload: "<message> (code <code>)".
std::string describe_error(const json &error_payload);

// Standard CDP error codes seen from Chrome.
constexpr int SERVER_ERROR = -32000;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;

} // namespace cdp_message

#endif // PAGEPILOT_CDP_MESSAGE_HPP
