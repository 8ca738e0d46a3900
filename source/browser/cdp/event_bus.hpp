#ifndef PAGEPILOT_EVENT_BUS_HPP
#define PAGEPILOT_EVENT_BUS_HPP

// Registry of listeners for unsolicited CDP events.
// A listener is owned by the Subscription handle returned from subscribe(); the
// handle deregisters it exactly once when destroyed or reset, whatever path the
// owner leaves by. Events are not buffered: a listener only sees events dispatched
// while it is registered.

#include "browser/driver_types.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace cdp {

class EventBus {
public:
    using EventCallback = std::function<void(const browser_driver::CdpEvent &event)>;
    // Called once when the listener's session is gone: NotAttached after close_session(),
    // the close_all() kind after a transport drop. A listener registered after either
    // has already happened is told straight from subscribe().
    using SessionClosedCallback = std::function<void(browser_driver::ErrorKind kind, const std::string &detail)>;

    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription &&other) noexcept;
        Subscription &operator=(Subscription &&other) noexcept;
        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;

        // Deregister now. No-op if already released.
        void reset();
        bool active() const { return bus_ != nullptr; }

    private:
        friend class EventBus;
        Subscription(EventBus *bus, uint64_t listener_id) : bus_(bus), listener_id_(listener_id) {}

        EventBus *bus_ = nullptr;
        uint64_t listener_id_ = 0;
    };

    EventBus() = default;
    EventBus(const EventBus &) = delete;
    EventBus &operator=(const EventBus &) = delete;

    // Register interest in events of session_id whose method is in methods
    // (an empty set matches every method of that session).
    Subscription subscribe(const std::string &session_id, std::set<std::string> methods,
                           EventCallback on_event, SessionClosedCallback on_session_closed = nullptr);

    // Deliver an event to every matching listener, in call order. Callbacks run
    // outside the registry lock and may release their own subscription.
    void dispatch(const browser_driver::CdpEvent &event);

    // Tell the listeners of a session that it is gone. They stay registered until
    // their handles release them. The most recent closed sessions are remembered.
    void close_session(const std::string &session_id);

    // Same as close_session() for every session (transport went down); latched for good.
    void close_all(browser_driver::ErrorKind kind, const std::string &detail);

    std::size_t listener_count() const;
    std::size_t listener_count(const std::string &session_id) const;
    std::size_t closed_session_count() const;

    static constexpr std::size_t kClosedSessionMemory = 256;

private:
    struct Listener {
        std::string session_id;
        std::set<std::string> methods;
        EventCallback on_event;
        SessionClosedCallback on_session_closed;
        bool active = true;
    };

    void remove_listener(uint64_t listener_id);

    mutable std::mutex listeners_mutex_;
    uint64_t next_listener_id_ = 1;
    std::map<uint64_t, std::shared_ptr<Listener>> listeners_;
    std::set<std::string> closed_sessions_;
    std::deque<std::string> closed_session_order_;
    bool bus_down_ = false;
    browser_driver::ErrorKind bus_down_kind_ = browser_driver::ErrorKind::Transport;
    std::string bus_down_detail_;
};

// Waits for one event, registered up front so the event cannot slip past between
// issuing the command that triggers it and starting to wait.
class EventWaiter {
public:
    EventWaiter(EventBus &bus, const std::string &session_id, std::set<std::string> methods);

    EventWaiter(const EventWaiter &) = delete;
    EventWaiter &operator=(const EventWaiter &) = delete;

    // Block until a matching event arrives (success), the deadline passes (Timeout)
    // or the session goes away (NotAttached on close, Transport on a drop). The
    // listener is released before returning.
    browser_driver::EventResult wait(int timeout_milliseconds);

private:
    struct WaitState {
        std::mutex mutex;
        std::condition_variable condition;
        bool received = false;
        bool session_closed = false;
        browser_driver::ErrorKind closed_kind = browser_driver::ErrorKind::NotAttached;
        std::string closed_detail;
        browser_driver::CdpEvent event;
    };

    std::string session_id_;
    std::shared_ptr<WaitState> state_;
    EventBus::Subscription subscription_;
};

// Subscribe, wait and release in one call.
browser_driver::EventResult wait_for_event(EventBus &bus, const std::string &session_id,
                                           const std::set<std::string> &methods,
                                           int timeout_milliseconds);

} // namespace cdp

#endif // PAGEPILOT_EVENT_BUS_HPP
