// Tests for event listener registration, one-shot waits and listener release.

#include "browser/cdp/event_bus.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using browser_driver::CdpEvent;
using browser_driver::ErrorKind;
using browser_driver::EventResult;

namespace test_event_bus {

static CdpEvent make_event(const std::string &session_id, const std::string &method) {
    CdpEvent event;
    event.session_id = session_id;
    event.method = method;
    event.params["timestamp"] = 12.5;
    return event;
}

static long milliseconds_since(std::chrono::steady_clock::time_point start_time) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
}

// Test: dispatch reaches listeners of the same session and method only.
static bool test_dispatch_matches_session_and_method() {
    cdp::EventBus bus;
    int load_count = 0;
    int any_count = 0;
    int other_session_count = 0;
    auto load_subscription = bus.subscribe("session-A", {"Page.loadEventFired"},
                                           [&load_count](const CdpEvent &) { ++load_count; });
    auto any_subscription = bus.subscribe("session-A", {}, [&any_count](const CdpEvent &) { ++any_count; });
    auto other_subscription = bus.subscribe("session-B", {"Page.loadEventFired"},
                                            [&other_session_count](const CdpEvent &) { ++other_session_count; });

    bus.dispatch(make_event("session-A", "Page.loadEventFired"));
    bus.dispatch(make_event("session-A", "Page.domContentEventFired"));
    bus.dispatch(make_event("", "Target.targetCreated"));

    bool success = load_count == 1 && any_count == 2 && other_session_count == 0;
    if (success) {
        std::cout << "  OK: Events routed by session id and method filter" << std::endl;
    } else {
        std::cout << "  FAIL: load=" << load_count << " any=" << any_count << " other=" << other_session_count
                  << std::endl;
    }
    return success;
}

// Test: a subscription handle deregisters its listener when it leaves scope.
static bool test_subscription_releases_on_scope_exit() {
    cdp::EventBus bus;
    int received = 0;
    {
        auto subscription = bus.subscribe("session-A", {"Page.loadEventFired"},
                                          [&received](const CdpEvent &) { ++received; });
        if (bus.listener_count() != 1) {
            std::cout << "  FAIL: listener not registered" << std::endl;
            return false;
        }
        cdp::EventBus::Subscription moved = std::move(subscription);
        if (subscription.active() || !moved.active() || bus.listener_count() != 1) {
            std::cout << "  FAIL: move did not transfer the registration" << std::endl;
            return false;
        }
    }
    bus.dispatch(make_event("session-A", "Page.loadEventFired"));

    bool success = bus.listener_count() == 0 && received == 0;
    if (success) {
        std::cout << "  OK: Listener released exactly once when its handle is destroyed" << std::endl;
    } else {
        std::cout << "  FAIL: listeners=" << bus.listener_count() << " received=" << received << std::endl;
    }
    return success;
}

// Test: the waiter sees an event dispatched from another thread after it started waiting.
static bool test_waiter_receives_event_from_other_thread() {
    cdp::EventBus bus;
    cdp::EventWaiter waiter(bus, "session-A", {"Page.loadEventFired"});
    std::thread dispatcher([&bus] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus.dispatch(make_event("session-A", "Page.loadEventFired"));
    });
    EventResult result = waiter.wait(2000);
    dispatcher.join();

    bool success = result.success && result.event.method == "Page.loadEventFired" &&
                   result.event.params.value("timestamp", 0.0) == 12.5 && bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: Waiter received event and released its listener" << std::endl;
    } else {
        std::cout << "  FAIL: wait gave '" << result.error_detail << "' listeners=" << bus.listener_count()
                  << std::endl;
    }
    return success;
}

// Test: an event that arrives between subscribing and waiting is not lost.
static bool test_event_before_wait_is_kept_for_registered_waiter() {
    cdp::EventBus bus;
    cdp::EventWaiter waiter(bus, "session-A", {"Page.loadEventFired"});
    bus.dispatch(make_event("session-A", "Page.loadEventFired"));
    EventResult result = waiter.wait(100);

    bool success = result.success;
    if (success) {
        std::cout << "  OK: Event dispatched after subscribe but before wait() is delivered" << std::endl;
    } else {
        std::cout << "  FAIL: registered waiter missed an early event: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: a timeout is reported no earlier than the timeout and leaves no listener behind.
static bool test_timeout_not_early_and_released() {
    cdp::EventBus bus;
    auto start_time = std::chrono::steady_clock::now();
    EventResult result = cdp::wait_for_event(bus, "session-A", {"Page.loadEventFired"}, 150);
    long elapsed = milliseconds_since(start_time);

    bool success = !result.success && result.error_kind == ErrorKind::Timeout && elapsed >= 150 &&
                   elapsed < 1000 && bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: Timeout after " << elapsed << " ms with no listener left" << std::endl;
    } else {
        std::cout << "  FAIL: kind=" << browser_driver::error_kind_name(result.error_kind) << " elapsed=" << elapsed
                  << " listeners=" << bus.listener_count() << std::endl;
    }
    return success;
}

// Test: events are not buffered for listeners that register later.
static bool test_past_events_are_not_replayed() {
    cdp::EventBus bus;
    bus.dispatch(make_event("session-A", "Page.loadEventFired"));
    EventResult result = cdp::wait_for_event(bus, "session-A", {"Page.loadEventFired"}, 100);

    bool success = !result.success && result.error_kind == ErrorKind::Timeout;
    if (success) {
        std::cout << "  OK: Event dispatched before subscribing is not replayed" << std::endl;
    } else {
        std::cout << "  FAIL: late subscriber saw a past event" << std::endl;
    }
    return success;
}

// Test: closing the session ends a wait early with NotAttached.
static bool test_session_close_ends_wait() {
    cdp::EventBus bus;
    std::thread closer([&bus] {
        while (bus.listener_count("session-A") == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus.close_session("session-A");
    });
    auto start_time = std::chrono::steady_clock::now();
    EventResult result = cdp::wait_for_event(bus, "session-A", {"Page.loadEventFired"}, 5000);
    long elapsed = milliseconds_since(start_time);
    closer.join();

    bool success = !result.success && result.error_kind == ErrorKind::NotAttached && elapsed < 2000 &&
                   bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: Session close ends the wait with NotAttachedError" << std::endl;
    } else {
        std::cout << "  FAIL: kind=" << browser_driver::error_kind_name(result.error_kind) << " elapsed=" << elapsed
                  << std::endl;
    }
    return success;
}

// Test: a transport drop ends a wait with Transport and keeps the reason.
static bool test_transport_drop_ends_wait_with_transport() {
    cdp::EventBus bus;
    std::thread dropper([&bus] {
        while (bus.listener_count("session-A") == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus.close_all(ErrorKind::Transport, "transport closed: browser exited");
    });
    auto start_time = std::chrono::steady_clock::now();
    EventResult result = cdp::wait_for_event(bus, "session-A", {"Page.loadEventFired"}, 5000);
    long elapsed = milliseconds_since(start_time);
    dropper.join();

    bool success = !result.success && result.error_kind == ErrorKind::Transport && elapsed < 2000 &&
                   result.error_detail.find("browser exited") != std::string::npos && bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: Transport drop ends the wait with TransportError" << std::endl;
    } else {
        std::cout << "  FAIL: kind=" << browser_driver::error_kind_name(result.error_kind) << " detail '"
                  << result.error_detail << "' elapsed=" << elapsed << std::endl;
    }
    return success;
}

// Test: listeners registered after a session close or a drop are told straight away.
static bool test_late_listener_learns_of_earlier_close() {
    cdp::EventBus bus;
    bus.close_session("session-A");

    auto start_time = std::chrono::steady_clock::now();
    EventResult closed_session = cdp::wait_for_event(bus, "session-A", {"Page.loadEventFired"}, 5000);
    EventResult open_session = cdp::wait_for_event(bus, "session-B", {"Page.loadEventFired"}, 100);

    bus.close_all(ErrorKind::Transport, "transport closed: gone");
    EventResult after_drop = cdp::wait_for_event(bus, "session-B", {"Page.loadEventFired"}, 5000);
    long elapsed = milliseconds_since(start_time);

    bool success = !closed_session.success && closed_session.error_kind == ErrorKind::NotAttached &&
                   !open_session.success && open_session.error_kind == ErrorKind::Timeout &&
                   !after_drop.success && after_drop.error_kind == ErrorKind::Transport && elapsed < 2000 &&
                   bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: Late waiters fail at once on a closed session or a dropped transport" << std::endl;
    } else {
        std::cout << "  FAIL: closed=" << browser_driver::error_kind_name(closed_session.error_kind)
                  << " open=" << browser_driver::error_kind_name(open_session.error_kind)
                  << " dropped=" << browser_driver::error_kind_name(after_drop.error_kind) << " elapsed=" << elapsed
                  << std::endl;
    }
    return success;
}

// Test: the record of closed sessions keeps only the most recent ones.
static bool test_closed_session_record_is_bounded() {
    cdp::EventBus bus;
    const std::size_t closed_total = cdp::EventBus::kClosedSessionMemory + 100;
    for (std::size_t index = 0; index < closed_total; ++index) {
        bus.close_session("session-" + std::to_string(index));
    }
    EventResult newest = cdp::wait_for_event(bus, "session-" + std::to_string(closed_total - 1),
                                             {"Page.loadEventFired"}, 2000);

    bool success = bus.closed_session_count() == cdp::EventBus::kClosedSessionMemory &&
                   newest.error_kind == ErrorKind::NotAttached;
    if (success) {
        std::cout << "  OK: Closed-session record capped at " << bus.closed_session_count() << " entries"
                  << std::endl;
    } else {
        std::cout << "  FAIL: closed_session_count=" << bus.closed_session_count()
                  << " newest=" << browser_driver::error_kind_name(newest.error_kind) << std::endl;
    }
    return success;
}

// Test: a listener released by an earlier callback of the same dispatch is skipped.
static bool test_listener_released_during_dispatch_is_skipped() {
    cdp::EventBus bus;
    int second_count = 0;
    cdp::EventBus::Subscription second;
    auto first = bus.subscribe("session-A", {"Page.loadEventFired"},
                               [&second](const CdpEvent &) { second.reset(); });
    second = bus.subscribe("session-A", {"Page.loadEventFired"},
                           [&second_count](const CdpEvent &) { ++second_count; });

    bus.dispatch(make_event("session-A", "Page.loadEventFired"));

    bool success = second_count == 0 && bus.listener_count() == 1;
    if (success) {
        std::cout << "  OK: Listener released mid-dispatch is not called" << std::endl;
    } else {
        std::cout << "  FAIL: second_count=" << second_count << " listeners=" << bus.listener_count() << std::endl;
    }
    return success;
}

// Test: many concurrent waiters on different sessions each get their own event.
static bool test_concurrent_waiters_on_separate_sessions() {
    cdp::EventBus bus;
    const int waiter_count = 8;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> waiters;
    std::atomic<int> registered{0};
    for (int index = 0; index < waiter_count; ++index) {
        waiters.emplace_back([&bus, &succeeded, &registered, index] {
            cdp::EventWaiter waiter(bus, "session-" + std::to_string(index), {"Page.loadEventFired"});
            ++registered;
            if (waiter.wait(2000).success) {
                ++succeeded;
            }
        });
    }
    while (registered < waiter_count) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    for (int index = waiter_count - 1; index >= 0; --index) {
        bus.dispatch(make_event("session-" + std::to_string(index), "Page.loadEventFired"));
    }
    for (auto &waiter : waiters) {
        waiter.join();
    }

    bool success = succeeded == waiter_count && bus.listener_count() == 0;
    if (success) {
        std::cout << "  OK: " << waiter_count << " concurrent waiters each received their session's event"
                  << std::endl;
    } else {
        std::cout << "  FAIL: succeeded=" << succeeded << " listeners=" << bus.listener_count() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_dispatch_matches_session_and_method();
    all_passed &= test_subscription_releases_on_scope_exit();
    all_passed &= test_waiter_receives_event_from_other_thread();
    all_passed &= test_event_before_wait_is_kept_for_registered_waiter();
    all_passed &= test_timeout_not_early_and_released();
    all_passed &= test_past_events_are_not_replayed();
    all_passed &= test_session_close_ends_wait();
    all_passed &= test_transport_drop_ends_wait_with_transport();
    all_passed &= test_late_listener_learns_of_earlier_close();
    all_passed &= test_closed_session_record_is_bounded();
    all_passed &= test_listener_released_during_dispatch_is_skipped();
    all_passed &= test_concurrent_waiters_on_separate_sessions();
    return all_passed;
}

} // namespace test_event_bus
