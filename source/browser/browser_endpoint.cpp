#include "browser/browser_endpoint.hpp"
#include "browser/cdp/websocket_transport.hpp"
#include "utils/debug_log.hpp"

namespace browser_endpoint {

using browser_driver::DriverResult;
using browser_driver::ErrorKind;

DriverResult open_endpoint(const settings::Settings &settings, Endpoint &endpoint) {
    DriverResult result;
    std::string websocket_url = settings.websocket_url;

    if (websocket_url.empty()) {
        cdp_chrome_launch::LaunchOptions launch_options;
        launch_options.executable_path = settings.chrome_executable;
        launch_options.headless = settings.headless;
        endpoint.launch = cdp_chrome_launch::launch_chrome(launch_options);
        if (!endpoint.launch.success) {
            result.error_kind = ErrorKind::Transport;
            result.error_detail = endpoint.launch.error_message;
            result.message = "Failed to launch Chrome.";
            cdp_chrome_launch::terminate_chrome(endpoint.launch);
            return result;
        }
        websocket_url = endpoint.launch.websocket_debugger_url;
    } else {
        debug_log::log("open_endpoint: using configured endpoint " + websocket_url);
    }

    auto transport = std::make_unique<cdp::WebSocketTransport>(websocket_url, settings.connect_timeout_milliseconds);
    endpoint.connection = std::make_shared<cdp::Connection>(std::move(transport));
    DriverResult open_result = endpoint.connection->open();
    if (!open_result.success) {
        close_endpoint(endpoint);
        open_result.message = "Failed to connect to Chrome CDP.";
        return open_result;
    }

    result.success = true;
    result.message = "Connected to " + websocket_url;
    return result;
}

void close_endpoint(Endpoint &endpoint) {
    if (endpoint.connection != nullptr) {
        endpoint.connection->close();
        endpoint.connection.reset();
    }
    cdp_chrome_launch::terminate_chrome(endpoint.launch);
}

} // namespace browser_endpoint
