#ifndef PAGEPILOT_PAGE_HPP
#define PAGEPILOT_PAGE_HPP

// Page session: one browser tab under automation control.
// A Page owns its target for its whole life and is single-use:
// Created -> Attached (page_lifecycle::open_page) -> Closed (close()).
// Every operation is a blocking call that reports failure through its result struct.

#include "browser/cdp/cdp_connection.hpp"
#include "browser/driver_types.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace page {

class Page {
public:
    // Wraps an already created target. The page is not attached yet.
    Page(std::shared_ptr<cdp::Connection> connection, std::string target_id);

    // Runs close().
    ~Page();

    Page(const Page &) = delete;
    Page &operator=(const Page &) = delete;

    // Attach a flattened debugging session to the target and enable the Page, Runtime
    // and DOM domains. Only the first call on a fresh page can succeed; any failure is
    // an Attach error and leaves the caller responsible for close().
    browser_driver::DriverResult attach();

    // Best-effort teardown: detach the session, close the target, mark not attached.
    // Commands and event waits still in flight end with NotAttached. Never fails;
    // safe to call repeatedly and on a page that never attached.
    void close();

    bool is_attached() const;
    const std::string &target_id() const { return target_id_; }
    std::string session_id() const;

    // Send a command on this page's session. NotAttached unless attached.
    browser_driver::CommandResult send_command(const std::string &method,
                                               const nlohmann::json &params = nlohmann::json::object());

    // Wait for one of the given events on this page's session.
    browser_driver::EventResult wait_for_event(const std::set<std::string> &methods, int timeout_milliseconds);

    // Navigate and wait for the load signal, then pause options.settle_milliseconds.
    // Fails with NavigationTimeout if the signal does not arrive in time.
    browser_driver::DriverResult go_to(const std::string &url,
                                       const browser_driver::NavigateOptions &options = browser_driver::NavigateOptions());

    // Poll exists(selector) every interval until true or the deadline passes (SelectorTimeout).
    browser_driver::DriverResult wait_for_selector(const std::string &selector,
                                                   const browser_driver::WaitOptions &options = browser_driver::WaitOptions());

    // Runtime.evaluate with returnByValue and awaitPromise. A thrown exception in the
    // page is an Evaluation error carrying its description.
    browser_driver::EvaluateResult evaluate(const std::string &expression);

    // Trimmed textContent of the first match; found is false when nothing matches.
    browser_driver::TextResult get_text(const std::string &selector);
    browser_driver::TextListResult get_text_all(const std::string &selector);
    browser_driver::TextResult get_attribute(const std::string &selector, const std::string &attribute);
    browser_driver::ExistsResult exists(const std::string &selector);
    // Clicking or typing into a missing element is not an error; message says so.
    browser_driver::DriverResult click(const std::string &selector);
    browser_driver::DriverResult type_text(const std::string &selector, const std::string &text);
    browser_driver::TextResult content();
    browser_driver::TextResult url();

    void sleep(int milliseconds) const;

private:
    enum class State {
        Created,
        Attached,
        Closed
    };

    browser_driver::TextResult evaluate_text(const std::string &expression);

    std::shared_ptr<cdp::Connection> connection_;
    std::string target_id_;
    std::string session_id_;
    State state_ = State::Created;
    mutable std::mutex state_mutex_;
};

} // namespace page

#endif // PAGEPILOT_PAGE_HPP
