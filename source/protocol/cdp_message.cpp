#include "protocol/cdp_message.hpp"

namespace cdp_message {

json build_command(int message_id, const std::string &method, const json &params,
                   const std::string &session_id) {
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }
    return command;
}

bool is_response(const json &message) {
    return message.is_object() && message.contains("id") && !message["id"].is_null();
}

bool is_event(const json &message) {
    return message.is_object() && !is_response(message) &&
           message.contains("method") && message["method"].is_string();
}

int get_id(const json &message) {
    if (message.contains("id") && message["id"].is_number_integer()) {
        return message["id"].get<int>();
    }
    return -1;
}

std::string get_session_id(const json &message) {
    if (message.contains("sessionId") && message["sessionId"].is_string()) {
        return message["sessionId"].get<std::string>();
    }
    return "";
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool has_error(const json &message) {
    return message.contains("error") && !message["error"].is_null();
}

std::string describe_error(const json &error_payload) {
    if (error_payload.is_string()) {
        return error_payload.get<std::string>();
    }
    if (!error_payload.is_object()) {
        return error_payload.dump();
    }
    std::string text = "unknown error";
    if (error_payload.contains("message") && error_payload["message"].is_string()) {
        text = error_payload["message"].get<std::string>();
    }
    if (error_payload.contains("code") && error_payload["code"].is_number_integer()) {
        text += " (code " + std::to_string(error_payload["code"].get<int>()) + ")";
    }
    if (error_payload.contains("data") && error_payload["data"].is_string()) {
        text += ": " + error_payload["data"].get<std::string>();
    }
    return text;
}

} // namespace cdp_message
