#ifndef PAGEPILOT_BROWSER_ENDPOINT_HPP
#define PAGEPILOT_BROWSER_ENDPOINT_HPP

// A live browser to automate: either an existing DevTools endpoint from settings or a
// Chrome launched for this process, plus the open CDP connection to it.

#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/cdp/cdp_connection.hpp"
#include "browser/driver_types.hpp"
#include "config/settings.hpp"

#include <memory>

namespace browser_endpoint {

struct Endpoint {
    std::shared_ptr<cdp::Connection> connection;
    // Filled only when Chrome was launched here.
    cdp_chrome_launch::ChromeLaunchResult launch;
};

// Connect to settings.websocket_url, or launch Chrome and connect to it.
// On failure endpoint is left empty and nothing keeps running.
browser_driver::DriverResult open_endpoint(const settings::Settings &settings, Endpoint &endpoint);

// Close the connection and terminate Chrome if it was launched here. Safe to repeat.
void close_endpoint(Endpoint &endpoint);

} // namespace browser_endpoint

#endif // PAGEPILOT_BROWSER_ENDPOINT_HPP
