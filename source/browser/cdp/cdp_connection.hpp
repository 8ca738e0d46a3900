#ifndef PAGEPILOT_CDP_CONNECTION_HPP
#define PAGEPILOT_CDP_CONNECTION_HPP

// One browser-level CDP connection: owns the transport, routes response frames to
// the CommandChannel and event frames to the EventBus. Pages share a connection and
// are told apart by their flattened session id.

#include "browser/cdp/cdp_transport.hpp"
#include "browser/cdp/command_channel.hpp"
#include "browser/cdp/event_bus.hpp"
#include "browser/driver_types.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace cdp {

class Connection {
public:
    explicit Connection(std::unique_ptr<Transport> transport);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Open the transport and start routing frames.
    browser_driver::DriverResult open();

    // Close the transport. In-flight commands and event waits fail with Transport.
    void close();

    bool is_open() const;

    // Send a command; an empty session_id addresses the browser itself.
    browser_driver::CommandResult send_command(const std::string &method,
                                               const nlohmann::json &params = nlohmann::json::object(),
                                               const std::string &session_id = "");

    // Drop a page session: its pending commands and event waits end with NotAttached.
    void close_session(const std::string &session_id);

    CommandChannel &commands() { return command_channel_; }
    EventBus &events() { return event_bus_; }

private:
    void handle_frame(const std::string &frame);
    void handle_closed(const std::string &reason);

    std::unique_ptr<Transport> transport_;
    CommandChannel command_channel_;
    EventBus event_bus_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closed_{false};
};

} // namespace cdp

#endif // PAGEPILOT_CDP_CONNECTION_HPP
