#ifndef PAGEPILOT_COMMAND_CHANNEL_HPP
#define PAGEPILOT_COMMAND_CHANNEL_HPP

// Request/response correlation for CDP commands.
// Every command gets an id from a per-session counter; the pending table is keyed by
// (session id, message id) so responses are routed to their waiter by id, never by
// send order, and two sessions sharing one WebSocket never collide.

#include "browser/driver_types.hpp"

#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace cdp {

using json = nlohmann::json;

class CommandChannel {
public:
    // Hands one serialized frame to the transport. Returns false if it could not be queued.
    using FrameWriter = std::function<bool(const std::string &frame)>;

    explicit CommandChannel(FrameWriter writer);

    CommandChannel(const CommandChannel &) = delete;
    CommandChannel &operator=(const CommandChannel &) = delete;

    // Send a command and block until its response arrives. An empty session_id sends a
    // browser-level command. There is no timeout here: the wait ends with the response,
    // with close_session() for that session, or with fail_all().
    browser_driver::CommandResult send(const std::string &session_id, const std::string &method,
                                       const json &params = json::object());

    // Route a response frame to its waiter. Returns false if nobody was waiting for it
    // (late answer to an abandoned command, or a stray id).
    bool resolve(const json &response);

    // Fail in-flight commands of the session with NotAttached and refuse later sends for it.
    // Only the most recent kClosedSessionMemory closed sessions are remembered.
    void close_session(const std::string &session_id);

    // Fail every in-flight command and refuse later sends (transport went down).
    void fail_all(browser_driver::ErrorKind kind, const std::string &detail);

    std::size_t pending_count() const;
    std::size_t pending_count(const std::string &session_id) const;
    std::size_t closed_session_count() const;

    static constexpr std::size_t kClosedSessionMemory = 256;

private:
    struct PendingCommand {
        std::string method;
        bool complete = false;
        browser_driver::CommandResult result;
    };
    using PendingKey = std::pair<std::string, int>;

    FrameWriter writer_;

    mutable std::mutex pending_mutex_;
    std::condition_variable pending_condition_;
    std::map<std::string, int> next_message_ids_;
    std::map<PendingKey, std::shared_ptr<PendingCommand>> pending_commands_;
    std::set<std::string> closed_sessions_;
    std::deque<std::string> closed_session_order_;
    bool channel_down_ = false;
    browser_driver::ErrorKind channel_down_kind_ = browser_driver::ErrorKind::Transport;
    std::string channel_down_detail_;
};

} // namespace cdp

#endif // PAGEPILOT_COMMAND_CHANNEL_HPP
