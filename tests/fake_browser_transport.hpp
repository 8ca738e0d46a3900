#ifndef PAGEPILOT_FAKE_BROWSER_TRANSPORT_HPP
#define PAGEPILOT_FAKE_BROWSER_TRANSPORT_HPP

// In-process stand-in for a browser's DevTools endpoint.
// Commands written by the client are answered by per-method responders; replies and
// events are queued with a delay and delivered in due-time order from a separate
// delivery thread, the way WebSocket frames arrive from the service thread.

#include "browser/cdp/cdp_transport.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

using json = nlohmann::json;

class FakeBrowserTransport : public cdp::Transport {
public:
    // Gets the parsed command; answers with respond()/respond_error()/emit_event(), or not at all.
    using Responder = std::function<void(FakeBrowserTransport &browser, const json &command)>;
    // Gets the Runtime.evaluate expression; returns the CDP result object
    // ({"result": {...}} or {"exceptionDetails": {...}, "result": {...}}).
    using Evaluator = std::function<json(const std::string &expression)>;

    FakeBrowserTransport();
    ~FakeBrowserTransport() override;

    bool open(FrameHandler on_frame, ClosedHandler on_closed, std::string &error_detail) override;
    bool send_text(const std::string &payload) override;
    void close() override;
    bool is_open() const override;

    // Replace the responder for one method.
    void set_responder(const std::string &method, Responder responder);
    void set_evaluator(Evaluator evaluator);
    // Delays of the lifecycle events emitted after Page.navigate; negative means never.
    void set_navigation_timing(int dom_content_delay_milliseconds, int load_delay_milliseconds);
    void set_refuse_open(bool refuse) { refuse_open_ = refuse; }

    void respond(const json &command, const json &result, int delay_milliseconds = 0);
    void respond_error(const json &command, int code, const std::string &message, int delay_milliseconds = 0);
    void emit_event(const std::string &session_id, const std::string &method, const json &params,
                    int delay_milliseconds = 0);
    // Queue a raw frame (text is delivered verbatim).
    void deliver_raw_after(int delay_milliseconds, const std::string &frame);
    void deliver_after(int delay_milliseconds, const json &frame);
    // Simulate the browser going away: the closed handler fires from the delivery thread.
    void drop_connection(const std::string &reason, int delay_milliseconds = 0);

    std::vector<json> sent_commands() const;
    std::vector<json> sent_commands(const std::string &method) const;
    std::size_t count_sent(const std::string &method) const;

private:
    struct Delivery {
        std::chrono::steady_clock::time_point due;
        uint64_t sequence;
        std::string frame;
        bool closes_connection;
        std::string close_reason;
    };
    struct LaterFirst {
        bool operator()(const Delivery &left, const Delivery &right) const {
            if (left.due != right.due) {
                return left.due > right.due;
            }
            return left.sequence > right.sequence;
        }
    };

    void install_default_responders();
    void enqueue(Delivery delivery, int delay_milliseconds);
    void delivery_loop();

    FrameHandler on_frame_;
    ClosedHandler on_closed_;

    mutable std::mutex mutex_;
    std::condition_variable delivery_condition_;
    std::priority_queue<Delivery, std::vector<Delivery>, LaterFirst> deliveries_;
    uint64_t next_sequence_ = 0;
    bool running_ = false;
    bool connected_ = false;
    bool refuse_open_ = false;
    std::thread delivery_thread_;

    std::map<std::string, Responder> responders_;
    Evaluator evaluator_;
    int dom_content_delay_milliseconds_ = 5;
    int load_delay_milliseconds_ = 10;
    int next_target_number_ = 1;
    std::vector<json> sent_commands_;
};

} // namespace test_support

#endif // PAGEPILOT_FAKE_BROWSER_TRANSPORT_HPP
