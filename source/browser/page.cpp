#include "browser/page.hpp"
#include "browser/cdp/event_bus.hpp"
#include "utils/debug_log.hpp"
#include "utils/script_escape.hpp"

#include <algorithm>
#include <initializer_list>
#include <chrono>
#include <thread>

namespace page {

using browser_driver::CommandResult;
using browser_driver::DriverResult;
using browser_driver::ErrorKind;
using browser_driver::EvaluateResult;
using browser_driver::EventResult;
using browser_driver::ExistsResult;
using browser_driver::TextListResult;
using browser_driver::TextResult;
using browser_driver::forward_failure;
using json = nlohmann::json;

namespace {

const char kLoadEventFired[] = "Page.loadEventFired";
const char kDomContentEventFired[] = "Page.domContentEventFired";

// Wraps body in an IIFE with `el` bound to the first match of selector.
std::string element_script(const std::string &selector, const std::string &body) {
    return "(function() {"
           " const el = document.querySelector(" + script_escape::quote(selector) + ");"
           " " + body +
           " })()";
}

long milliseconds_since(std::chrono::steady_clock::time_point start_time) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
}

DriverResult not_attached(const std::string &operation) {
    DriverResult result;
    result.error_kind = ErrorKind::NotAttached;
    result.error_detail = operation + ": page is not attached.";
    result.message = operation + " failed.";
    return result;
}

} // namespace

Page::Page(std::shared_ptr<cdp::Connection> connection, std::string target_id)
    : connection_(std::move(connection)), target_id_(std::move(target_id)) {}

Page::~Page() {
    close();
}

bool Page::is_attached() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::Attached;
}

std::string Page::session_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_id_;
}

DriverResult Page::attach() {
    DriverResult result;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Created) {
            result.error_kind = ErrorKind::Attach;
            result.error_detail = "Page " + target_id_ + " cannot be attached again.";
            result.message = "Failed to attach to the browser tab.";
            return result;
        }
    }

    json attach_params;
    attach_params["targetId"] = target_id_;
    attach_params["flatten"] = true;
    CommandResult attach_response = connection_->send_command("Target.attachToTarget", attach_params);
    if (!attach_response.success || !attach_response.result.contains("sessionId") ||
        !attach_response.result["sessionId"].is_string()) {
        result.error_kind = ErrorKind::Attach;
        result.error_detail = attach_response.success
                                  ? "Target.attachToTarget returned no sessionId: " + attach_response.result.dump()
                                  : attach_response.error_detail;
        result.message = "Failed to attach to the browser tab.";
        debug_log::log("attach: " + result.error_detail);
        return result;
    }

    std::string attached_session_id = attach_response.result["sessionId"].get<std::string>();
    bool closed_during_attach = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Created) {
            closed_during_attach = true;
        } else {
            session_id_ = attached_session_id;
            state_ = State::Attached;
        }
    }
    if (closed_during_attach) {
        // close() ran while the handshake was in flight and could not see this session.
        json detach_params;
        detach_params["sessionId"] = attached_session_id;
        CommandResult detach_response = connection_->send_command("Target.detachFromTarget", detach_params);
        if (!detach_response.success) {
            debug_log::log("attach: detach after close ignored: " + detach_response.error_detail);
        }
        result.error_kind = ErrorKind::Attach;
        result.error_detail = "Page " + target_id_ + " was closed during attach.";
        result.message = "Failed to attach to the browser tab.";
        return result;
    }
    debug_log::log("attach: targetId=" + target_id_ + " sessionId=" + session_id());

    for (const char *domain_enable : {"Page.enable", "Runtime.enable", "DOM.enable"}) {
        CommandResult enable_response = send_command(domain_enable);
        if (!enable_response.success) {
            result.error_kind = ErrorKind::Attach;
            result.error_detail = enable_response.error_detail;
            result.message = "Failed to enable protocol domains.";
            return result;
        }
    }

    result.success = true;
    result.message = "Attached.";
    return result;
}

void Page::close() {
    State previous_state;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous_state = state_;
        if (previous_state == State::Closed) {
            return;
        }
        state_ = State::Closed;
        session_id = session_id_;
    }

    if (previous_state == State::Attached) {
        connection_->close_session(session_id);

        json detach_params;
        detach_params["sessionId"] = session_id;
        CommandResult detach_response = connection_->send_command("Target.detachFromTarget", detach_params);
        if (!detach_response.success) {
            // Tab may already be gone.
            debug_log::log("close: detach ignored: " + detach_response.error_detail);
        }
    }

    if (!target_id_.empty()) {
        json close_params;
        close_params["targetId"] = target_id_;
        CommandResult close_response = connection_->send_command("Target.closeTarget", close_params);
        if (!close_response.success) {
            debug_log::log("close: closeTarget ignored: " + close_response.error_detail);
        }
    }
    debug_log::log("close: page " + target_id_ + " closed.");
}

CommandResult Page::send_command(const std::string &method, const json &params) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Attached) {
            return forward_failure<CommandResult>(not_attached(method));
        }
        session_id = session_id_;
    }
    return connection_->send_command(method, params, session_id);
}

EventResult Page::wait_for_event(const std::set<std::string> &methods, int timeout_milliseconds) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Attached) {
            return forward_failure<EventResult>(not_attached("wait_for_event"));
        }
        session_id = session_id_;
    }
    return cdp::wait_for_event(connection_->events(), session_id, methods, timeout_milliseconds);
}

DriverResult Page::go_to(const std::string &url, const browser_driver::NavigateOptions &options) {
    DriverResult result;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Attached) {
            return not_attached("go_to");
        }
        session_id = session_id_;
    }

    const char *load_event = (options.wait_until == browser_driver::WaitUntil::Load)
                                 ? kLoadEventFired
                                 : kDomContentEventFired;

    // Subscribe before navigating so a fast load cannot be missed.
    auto start_time = std::chrono::steady_clock::now();
    cdp::EventWaiter load_waiter(connection_->events(), session_id, {load_event});

    json navigate_params;
    navigate_params["url"] = url;
    CommandResult navigate_response = send_command("Page.navigate", navigate_params);
    if (!navigate_response.success) {
        result = forward_failure<DriverResult>(navigate_response);
        result.message = "Failed to navigate to " + url + ".";
        return result;
    }
    if (navigate_response.result.contains("errorText") && navigate_response.result["errorText"].is_string() &&
        !navigate_response.result["errorText"].get<std::string>().empty()) {
        result.error_kind = ErrorKind::Protocol;
        result.error_detail = navigate_response.result["errorText"].get<std::string>();
        result.message = "Failed to navigate to " + url + ".";
        return result;
    }

    int remaining_milliseconds = std::max(0, options.timeout_milliseconds - static_cast<int>(milliseconds_since(start_time)));
    EventResult load_result = load_waiter.wait(remaining_milliseconds);
    if (!load_result.success) {
        result = forward_failure<DriverResult>(load_result);
        if (load_result.error_kind == ErrorKind::Timeout) {
            result.error_kind = ErrorKind::NavigationTimeout;
            result.error_detail = "Navigation timeout after " + std::to_string(milliseconds_since(start_time)) +
                                  "ms waiting for " + load_event + " (" + url + ").";
        }
        result.message = "Failed to navigate to " + url + ".";
        return result;
    }

    // Give the page a moment to settle (for JS-rendered content).
    sleep(options.settle_milliseconds);

    result.success = true;
    result.message = "Navigated to " + url + ".";
    return result;
}

DriverResult Page::wait_for_selector(const std::string &selector, const browser_driver::WaitOptions &options) {
    DriverResult result;
    auto start_time = std::chrono::steady_clock::now();
    int check_count = 0;

    while (milliseconds_since(start_time) < options.timeout_milliseconds) {
        ExistsResult present = exists(selector);
        ++check_count;
        if (!present.success) {
            result = forward_failure<DriverResult>(present);
            result.message = "wait_for_selector failed.";
            return result;
        }
        if (present.exists) {
            result.success = true;
            result.message = "Selector found: " + selector;
            return result;
        }
        sleep(options.interval_milliseconds);
    }

    result.error_kind = ErrorKind::SelectorTimeout;
    result.error_detail = "Timeout waiting for selector: " + selector + " (" +
                          std::to_string(milliseconds_since(start_time)) + " ms, " +
                          std::to_string(check_count) + " checks)";
    result.message = "wait_for_selector failed.";
    return result;
}

EvaluateResult Page::evaluate(const std::string &expression) {
    EvaluateResult result;

    json eval_params;
    eval_params["expression"] = expression;
    eval_params["returnByValue"] = true;
    eval_params["awaitPromise"] = true;
    CommandResult eval_response = send_command("Runtime.evaluate", eval_params);
    if (!eval_response.success) {
        return forward_failure<EvaluateResult>(eval_response);
    }

    const json &payload = eval_response.result;
    if (payload.contains("exceptionDetails")) {
        const json &details = payload["exceptionDetails"];
        std::string description = "unknown exception";
        if (details.contains("exception") && details["exception"].contains("description") &&
            details["exception"]["description"].is_string()) {
            description = details["exception"]["description"].get<std::string>();
        } else if (details.contains("text") && details["text"].is_string()) {
            description = details["text"].get<std::string>();
        }
        result.error_kind = ErrorKind::Evaluation;
        result.error_detail = "Evaluation failed: " + description;
        return result;
    }

    if (payload.contains("result") && payload["result"].contains("value")) {
        result.value = payload["result"]["value"];
    }
    result.success = true;
    return result;
}

TextResult Page::evaluate_text(const std::string &expression) {
    EvaluateResult evaluated = evaluate(expression);
    if (!evaluated.success) {
        return forward_failure<TextResult>(evaluated);
    }
    TextResult result;
    if (evaluated.value.is_null()) {
        result.success = true;
        result.found = false;
        return result;
    }
    if (!evaluated.value.is_string()) {
        result.error_kind = ErrorKind::Protocol;
        result.error_detail = "Expected a string from the page, got: " + evaluated.value.dump();
        return result;
    }
    result.success = true;
    result.found = true;
    result.text = evaluated.value.get<std::string>();
    return result;
}

TextResult Page::get_text(const std::string &selector) {
    return evaluate_text(element_script(selector, "return el ? el.textContent.trim() : null;"));
}

TextListResult Page::get_text_all(const std::string &selector) {
    std::string script = "(function() {"
                         " const els = document.querySelectorAll(" + script_escape::quote(selector) + ");"
                         " return Array.from(els).map(el => el.textContent.trim());"
                         " })()";
    EvaluateResult evaluated = evaluate(script);
    if (!evaluated.success) {
        return forward_failure<TextListResult>(evaluated);
    }
    TextListResult result;
    if (!evaluated.value.is_array()) {
        result.error_kind = ErrorKind::Protocol;
        result.error_detail = "Expected an array from the page, got: " + evaluated.value.dump();
        return result;
    }
    for (const auto &item : evaluated.value) {
        result.texts.push_back(item.is_string() ? item.get<std::string>() : std::string());
    }
    result.success = true;
    return result;
}

TextResult Page::get_attribute(const std::string &selector, const std::string &attribute) {
    return evaluate_text(element_script(
        selector, "return el ? el.getAttribute(" + script_escape::quote(attribute) + ") : null;"));
}

ExistsResult Page::exists(const std::string &selector) {
    EvaluateResult evaluated = evaluate("!!document.querySelector(" + script_escape::quote(selector) + ")");
    if (!evaluated.success) {
        return forward_failure<ExistsResult>(evaluated);
    }
    ExistsResult result;
    result.success = true;
    result.exists = evaluated.value.is_boolean() && evaluated.value.get<bool>();
    return result;
}

DriverResult Page::click(const std::string &selector) {
    EvaluateResult evaluated = evaluate(element_script(selector, "if (el) el.click(); return !!el;"));
    if (!evaluated.success) {
        DriverResult result = forward_failure<DriverResult>(evaluated);
        result.message = "click failed.";
        return result;
    }
    DriverResult result;
    result.success = true;
    bool clicked = evaluated.value.is_boolean() && evaluated.value.get<bool>();
    result.message = clicked ? "Clicked." : "No element matches " + selector + "; nothing clicked.";
    return result;
}

DriverResult Page::type_text(const std::string &selector, const std::string &text) {
    EvaluateResult evaluated = evaluate(element_script(
        selector,
        "if (!el) return false;"
        " el.value = " + script_escape::quote(text) + ";"
        " el.dispatchEvent(new Event('input', { bubbles: true }));"
        " return true;"));
    if (!evaluated.success) {
        DriverResult result = forward_failure<DriverResult>(evaluated);
        result.message = "type failed.";
        return result;
    }
    DriverResult result;
    result.success = true;
    bool typed = evaluated.value.is_boolean() && evaluated.value.get<bool>();
    result.message = typed ? "Typed." : "No element matches " + selector + "; nothing typed.";
    return result;
}

TextResult Page::content() {
    return evaluate_text("document.documentElement.outerHTML");
}

TextResult Page::url() {
    return evaluate_text("window.location.href");
}

void Page::sleep(int milliseconds) const {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }
}

} // namespace page
