#include "browser/cdp/event_bus.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <utility>
#include <vector>

namespace cdp {

using browser_driver::CdpEvent;
using browser_driver::ErrorKind;
using browser_driver::EventResult;

// --- Subscription ---

EventBus::Subscription::~Subscription() {
    reset();
}

EventBus::Subscription::Subscription(Subscription &&other) noexcept
    : bus_(other.bus_), listener_id_(other.listener_id_) {
    other.bus_ = nullptr;
    other.listener_id_ = 0;
}

EventBus::Subscription &EventBus::Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        listener_id_ = other.listener_id_;
        other.bus_ = nullptr;
        other.listener_id_ = 0;
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (bus_ == nullptr) {
        return;
    }
    EventBus *bus = bus_;
    bus_ = nullptr;
    bus->remove_listener(listener_id_);
    listener_id_ = 0;
}

// --- EventBus ---

EventBus::Subscription EventBus::subscribe(const std::string &session_id, std::set<std::string> methods,
                                           EventCallback on_event, SessionClosedCallback on_session_closed) {
    auto listener = std::make_shared<Listener>();
    listener->session_id = session_id;
    listener->methods = std::move(methods);
    listener->on_event = std::move(on_event);
    listener->on_session_closed = std::move(on_session_closed);

    bool already_gone = false;
    ErrorKind gone_kind = ErrorKind::NotAttached;
    std::string gone_detail;
    uint64_t listener_id = 0;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listener_id = next_listener_id_++;
        listeners_[listener_id] = listener;
        if (bus_down_) {
            already_gone = true;
            gone_kind = bus_down_kind_;
            gone_detail = bus_down_detail_;
        } else if (!session_id.empty() && closed_sessions_.count(session_id) != 0) {
            already_gone = true;
            gone_detail = "session " + session_id + " is closed.";
        }
    }

    // Registered after the close went out; nobody else will tell this listener.
    if (already_gone && listener->on_session_closed) {
        listener->on_session_closed(gone_kind, gone_detail);
    }
    return Subscription(this, listener_id);
}

void EventBus::remove_listener(uint64_t listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto listener_iterator = listeners_.find(listener_id);
    if (listener_iterator == listeners_.end()) {
        return;
    }
    listener_iterator->second->active = false;
    listeners_.erase(listener_iterator);
}

void EventBus::dispatch(const CdpEvent &event) {
    std::vector<std::shared_ptr<Listener>> matching;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto &entry : listeners_) {
            const Listener &listener = *entry.second;
            if (listener.session_id != event.session_id) {
                continue;
            }
            if (!listener.methods.empty() && listener.methods.count(event.method) == 0) {
                continue;
            }
            matching.push_back(entry.second);
        }
    }

    for (const auto &listener : matching) {
        bool still_active = false;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            still_active = listener->active;
        }
        // A listener released by an earlier callback of this round is skipped.
        if (still_active && listener->on_event) {
            listener->on_event(event);
        }
    }
}

void EventBus::close_session(const std::string &session_id) {
    if (session_id.empty()) {
        return;
    }
    std::vector<std::shared_ptr<Listener>> affected;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        if (closed_sessions_.insert(session_id).second) {
            closed_session_order_.push_back(session_id);
            if (closed_session_order_.size() > kClosedSessionMemory) {
                closed_sessions_.erase(closed_session_order_.front());
                closed_session_order_.pop_front();
            }
        }
        for (const auto &entry : listeners_) {
            if (entry.second->session_id == session_id) {
                affected.push_back(entry.second);
            }
        }
    }
    std::string detail = "session " + session_id + " closed.";
    for (const auto &listener : affected) {
        if (listener->on_session_closed) {
            listener->on_session_closed(ErrorKind::NotAttached, detail);
        }
    }
}

void EventBus::close_all(ErrorKind kind, const std::string &detail) {
    std::vector<std::shared_ptr<Listener>> affected;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        if (bus_down_) {
            return;
        }
        bus_down_ = true;
        bus_down_kind_ = kind;
        bus_down_detail_ = detail;
        for (const auto &entry : listeners_) {
            affected.push_back(entry.second);
        }
    }
    for (const auto &listener : affected) {
        if (listener->on_session_closed) {
            listener->on_session_closed(kind, detail);
        }
    }
}

std::size_t EventBus::listener_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.size();
}

std::size_t EventBus::listener_count(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    std::size_t count = 0;
    for (const auto &entry : listeners_) {
        if (entry.second->session_id == session_id) {
            ++count;
        }
    }
    return count;
}

std::size_t EventBus::closed_session_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return closed_sessions_.size();
}

// --- EventWaiter ---

EventWaiter::EventWaiter(EventBus &bus, const std::string &session_id, std::set<std::string> methods)
    : session_id_(session_id), state_(std::make_shared<WaitState>()) {
    std::shared_ptr<WaitState> state = state_;
    subscription_ = bus.subscribe(
        session_id, std::move(methods),
        [state](const CdpEvent &event) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->received || state->session_closed) {
                return;
            }
            state->received = true;
            state->event = event;
            state->condition.notify_all();
        },
        [state](ErrorKind kind, const std::string &detail) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->received || state->session_closed) {
                return;
            }
            state->session_closed = true;
            state->closed_kind = kind;
            state->closed_detail = detail;
            state->condition.notify_all();
        });
}

EventResult EventWaiter::wait(int timeout_milliseconds) {
    EventResult result;
    auto start_time = std::chrono::steady_clock::now();
    auto deadline = start_time + std::chrono::milliseconds(timeout_milliseconds);

    bool received = false;
    bool session_closed = false;
    ErrorKind closed_kind = ErrorKind::NotAttached;
    std::string closed_detail;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->condition.wait_until(lock, deadline, [this] {
            return state_->received || state_->session_closed;
        });
        received = state_->received;
        session_closed = state_->session_closed;
        closed_kind = state_->closed_kind;
        closed_detail = state_->closed_detail;
        if (received) {
            result.event = state_->event;
        }
    }

    // Release on every outcome before reporting it.
    subscription_.reset();

    if (received) {
        result.success = true;
        return result;
    }
    if (session_closed) {
        result.error_kind = closed_kind;
        if (closed_kind == ErrorKind::NotAttached) {
            result.error_detail = "Session " + session_id_ + " closed while waiting for event.";
        } else {
            result.error_detail = "Connection lost while waiting for event: " + closed_detail;
        }
        return result;
    }
    long elapsed_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
    result.error_kind = ErrorKind::Timeout;
    result.error_detail = "Timed out after " + std::to_string(elapsed_milliseconds) + " ms waiting for event.";
    debug_log::log("EventWaiter: " + result.error_detail + " session=" + session_id_);
    return result;
}

EventResult wait_for_event(EventBus &bus, const std::string &session_id,
                           const std::set<std::string> &methods, int timeout_milliseconds) {
    EventWaiter waiter(bus, session_id, methods);
    return waiter.wait(timeout_milliseconds);
}

} // namespace cdp
