#include "browser/cdp/cdp_connection.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

namespace cdp {

using browser_driver::DriverResult;
using browser_driver::ErrorKind;
using json = nlohmann::json;

Connection::Connection(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport)),
      command_channel_([this](const std::string &frame) {
          return transport_ != nullptr && transport_->send_text(frame);
      }) {}

Connection::~Connection() {
    close();
}

DriverResult Connection::open() {
    DriverResult result;
    if (transport_ == nullptr) {
        result.error_kind = ErrorKind::Transport;
        result.error_detail = "No transport.";
        result.message = "Failed to open CDP connection.";
        return result;
    }
    if (opened_) {
        result.error_kind = ErrorKind::Transport;
        result.error_detail = "Connection already opened once.";
        result.message = "Failed to open CDP connection.";
        return result;
    }

    std::string error_detail;
    bool transport_open = transport_->open(
        [this](const std::string &frame) { handle_frame(frame); },
        [this](const std::string &reason) { handle_closed(reason); },
        error_detail);
    if (!transport_open) {
        result.error_kind = ErrorKind::Transport;
        result.error_detail = error_detail;
        result.message = "Failed to open CDP connection.";
        return result;
    }

    opened_ = true;
    result.success = true;
    result.message = "CDP connection open.";
    return result;
}

void Connection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (transport_ != nullptr) {
        transport_->close();
    }
    command_channel_.fail_all(ErrorKind::Transport, "connection closed.");
    event_bus_.close_all(ErrorKind::Transport, "connection closed.");
    debug_log::log("Connection closed.");
}

bool Connection::is_open() const {
    return opened_ && !closed_ && transport_ != nullptr && transport_->is_open();
}

browser_driver::CommandResult Connection::send_command(const std::string &method, const json &params,
                                                       const std::string &session_id) {
    return command_channel_.send(session_id, method, params);
}

void Connection::close_session(const std::string &session_id) {
    command_channel_.close_session(session_id);
    event_bus_.close_session(session_id);
}

void Connection::handle_frame(const std::string &frame) {
    json message;
    try {
        message = json::parse(frame);
    } catch (const json::parse_error &parse_error) {
        debug_log::warn(std::string("Failed to parse CDP message: ") + parse_error.what() +
                        ", buffer content: " + frame.substr(0, 200));
        return;
    }

    if (cdp_message::is_response(message)) {
        command_channel_.resolve(message);
        return;
    }

    if (cdp_message::is_event(message)) {
        browser_driver::CdpEvent event;
        event.session_id = cdp_message::get_session_id(message);
        event.method = cdp_message::get_method(message);
        event.params = cdp_message::get_params(message);
        debug_log::log("CDP event: " + event.method +
                       (event.session_id.empty() ? std::string() : " session=" + event.session_id));
        event_bus_.dispatch(event);
        return;
    }

    debug_log::log("Ignoring CDP frame that is neither response nor event: " + frame.substr(0, 200));
}

void Connection::handle_closed(const std::string &reason) {
    command_channel_.fail_all(ErrorKind::Transport, "transport closed: " + reason);
    event_bus_.close_all(ErrorKind::Transport, "transport closed: " + reason);
}

} // namespace cdp
