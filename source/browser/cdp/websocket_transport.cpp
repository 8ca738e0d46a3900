#include "browser/cdp/websocket_transport.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace cdp {

namespace {

int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                       void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    struct lws_context *context = lws_get_context(websocket_instance);
    if (context == nullptr) {
        return 0;
    }
    auto *transport = static_cast<WebSocketTransport *>(lws_context_user(context));
    if (transport == nullptr) {
        return 0;
    }
    return transport->handle_callback(websocket_instance, static_cast<int>(reason),
                                      incoming_data, incoming_length);
}

// WebSocket protocol definition for libwebsockets.
const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

} // namespace

WebSocketTransport::WebSocketTransport(std::string websocket_url, int connect_timeout_milliseconds)
    : websocket_url_(std::move(websocket_url)),
      connect_timeout_milliseconds_(connect_timeout_milliseconds) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

bool WebSocketTransport::parse_url(const std::string &websocket_url, std::string &host, int &port,
                                   std::string &path) {
    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.compare(0, 5, "ws://") == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    } else if (url_without_scheme.find("://") != std::string::npos) {
        // Only plain ws:// is spoken by the local DevTools endpoint.
        return false;
    }

    std::string host_and_port;
    path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    host = "127.0.0.1";
    port = 9222;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        host = host_and_port.substr(0, colon_position);
        try {
            port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            return false;
        }
        if (port <= 0 || port > 65535) {
            return false;
        }
    } else if (!host_and_port.empty()) {
        host = host_and_port;
    }
    return !host.empty();
}

bool WebSocketTransport::open(FrameHandler on_frame, ClosedHandler on_closed, std::string &error_detail) {
    if (running_) {
        error_detail = "Transport already open.";
        return false;
    }

    std::string host;
    std::string path;
    int port = 0;
    if (!parse_url(websocket_url_, host, port, path)) {
        error_detail = "Malformed WebSocket URL: " + websocket_url_;
        return false;
    }

    on_frame_ = std::move(on_frame);
    on_closed_ = std::move(on_closed);
    connected_ = false;
    connection_failed_ = false;
    closed_notified_ = false;
    connection_error_.clear();
    receive_buffer_.clear();

    lws_set_log_level(debug_log::is_debug_enabled() ? (LLL_ERR | LLL_WARN | LLL_NOTICE) : LLL_ERR, nullptr);

    // Create libwebsockets context.
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        error_detail = "Failed to create libwebsockets context.";
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    debug_log::log("WebSocketTransport::open host=" + host + " port=" + std::to_string(port) + " path=" + path);
    websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (websocket_connection_ == nullptr) {
        error_detail = "lws_client_connect_via_info returned null for " + websocket_url_;
        destroy_context();
        return false;
    }

    // Drive the handshake on the caller's thread; the service thread starts once connected.
    auto start_time = std::chrono::steady_clock::now();
    while (!connected_) {
        lws_service(websocket_context_, 50);

        if (connection_failed_) {
            error_detail = "WebSocket connection failed: " +
                           (connection_error_.empty() ? std::string("unknown") : connection_error_);
            destroy_context();
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > connect_timeout_milliseconds_) {
            error_detail = "Timed out connecting to " + websocket_url_ + " after " +
                           std::to_string(connect_timeout_milliseconds_) + " ms.";
            destroy_context();
            return false;
        }
    }

    running_ = true;
    service_thread_ = std::thread(&WebSocketTransport::service_loop, this);
    debug_log::log("WebSocketTransport connected to " + websocket_url_);
    return true;
}

bool WebSocketTransport::send_text(const std::string &payload) {
    // The lock also keeps close() from destroying the context under us.
    std::lock_guard<std::mutex> lock(outgoing_mutex_);
    if (!running_ || !connected_) {
        return false;
    }
    outgoing_frames_.push_back(payload);
    // Wake the service thread; it asks for a writeable callback in EVENT_WAIT_CANCELLED.
    lws_cancel_service(websocket_context_);
    return true;
}

void WebSocketTransport::close() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        was_running = running_.exchange(false);
        if (was_running && websocket_context_ != nullptr) {
            lws_cancel_service(websocket_context_);
        }
    }
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    destroy_context();
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        outgoing_frames_.clear();
    }
    if (was_running) {
        debug_log::log("WebSocketTransport closed: " + websocket_url_);
    }
}

bool WebSocketTransport::is_open() const {
    return running_ && connected_;
}

void WebSocketTransport::service_loop() {
    while (running_) {
        lws_service(websocket_context_, 50);
    }
}

void WebSocketTransport::destroy_context() {
    if (websocket_context_ != nullptr) {
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
    }
    websocket_connection_ = nullptr;
}

void WebSocketTransport::notify_closed(const std::string &reason) {
    // Only an unexpected drop is reported; close() clears running_ first.
    if (!running_) {
        return;
    }
    if (closed_notified_.exchange(true)) {
        return;
    }
    debug_log::warn("CDP WebSocket closed: " + reason);
    if (on_closed_) {
        on_closed_(reason);
    }
}

int WebSocketTransport::write_next_frame(struct lws *websocket_instance) {
    std::string frame;
    bool more_pending = false;
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        if (outgoing_frames_.empty()) {
            return 0;
        }
        frame = std::move(outgoing_frames_.front());
        outgoing_frames_.pop_front();
        more_pending = !outgoing_frames_.empty();
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + frame.size());
    memcpy(send_buffer.data() + LWS_PRE, frame.data(), frame.size());

    int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE,
                                  frame.size(), LWS_WRITE_TEXT);
    if (bytes_written < static_cast<int>(frame.size())) {
        debug_log::warn("lws_write failed (" + std::to_string(bytes_written) + " of " +
                        std::to_string(frame.size()) + " bytes), dropping connection.");
        return -1;
    }

    if (more_pending) {
        lws_callback_on_writable(websocket_instance);
    }
    return 0;
}

int WebSocketTransport::handle_callback(struct lws *websocket_instance, int reason,
                                        void *incoming_data, size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connected_ = true;
        debug_log::log("CDP WebSocket connected.");
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        // Accumulate incoming data until the whole message is in.
        const char *data_pointer = static_cast<const char *>(incoming_data);
        receive_buffer_.append(data_pointer, incoming_length);

        if (lws_is_final_fragment(websocket_instance) &&
            lws_remaining_packet_payload(websocket_instance) == 0) {
            std::string frame;
            frame.swap(receive_buffer_);
            if (on_frame_) {
                on_frame_(frame);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE:
        return write_next_frame(websocket_instance);

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // Raised on the service thread by lws_cancel_service() from send_text().
        if (connected_ && websocket_connection_ != nullptr) {
            bool has_pending = false;
            {
                std::lock_guard<std::mutex> lock(outgoing_mutex_);
                has_pending = !outgoing_frames_.empty();
            }
            if (has_pending) {
                lws_callback_on_writable(websocket_connection_);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        connection_error_ = incoming_data ? std::string(static_cast<const char *>(incoming_data))
                                          : std::string("unknown");
        debug_log::log("CDP WebSocket connection error (LWS): " + connection_error_);
        connected_ = false;
        connection_failed_ = true;
        websocket_connection_ = nullptr;
        notify_closed("connection error: " + connection_error_);
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        connected_ = false;
        websocket_connection_ = nullptr;
        notify_closed("remote end closed the WebSocket");
        break;

    default:
        break;
    }

    return 0;
}

} // namespace cdp
