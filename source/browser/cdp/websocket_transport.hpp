#ifndef PAGEPILOT_WEBSOCKET_TRANSPORT_HPP
#define PAGEPILOT_WEBSOCKET_TRANSPORT_HPP

// libwebsockets client implementation of cdp::Transport.
// One service thread owns the lws context: it receives frames, hands them to the
// frame handler and drains the outgoing queue whenever the socket is writeable.

#include "browser/cdp/cdp_transport.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

struct lws_context;
struct lws;

namespace cdp {

class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(std::string websocket_url, int connect_timeout_milliseconds = 20000);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport &) = delete;
    WebSocketTransport &operator=(const WebSocketTransport &) = delete;

    bool open(FrameHandler on_frame, ClosedHandler on_closed, std::string &error_detail) override;
    bool send_text(const std::string &payload) override;
    void close() override;
    bool is_open() const override;

    // Split "ws://host:port/path" into its parts. Returns false if the URL is malformed.
    static bool parse_url(const std::string &websocket_url, std::string &host, int &port, std::string &path);

    // Dispatch target of the file-level libwebsockets callback; reason is an lws_callback_reasons value.
    int handle_callback(struct lws *websocket_instance, int reason,
                        void *incoming_data, size_t incoming_length);

private:
    void service_loop();
    int write_next_frame(struct lws *websocket_instance);
    void notify_closed(const std::string &reason);
    void destroy_context();

    std::string websocket_url_;
    int connect_timeout_milliseconds_;

    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;

    std::atomic<bool> connected_{false};
    std::atomic<bool> connection_failed_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_notified_{false};
    std::string connection_error_;

    FrameHandler on_frame_;
    ClosedHandler on_closed_;

    // Buffer for incoming fragments; touched only by the service thread.
    std::string receive_buffer_;

    std::mutex outgoing_mutex_;
    std::deque<std::string> outgoing_frames_;

    std::thread service_thread_;
};

} // namespace cdp

#endif // PAGEPILOT_WEBSOCKET_TRANSPORT_HPP
