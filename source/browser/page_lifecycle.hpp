#ifndef PAGEPILOT_PAGE_LIFECYCLE_HPP
#define PAGEPILOT_PAGE_LIFECYCLE_HPP

// Creating and tearing down page sessions.

#include "browser/cdp/cdp_connection.hpp"
#include "browser/driver_types.hpp"
#include "browser/page.hpp"

#include <memory>
#include <string>

namespace page_lifecycle {

struct OpenPageResult {
    bool success = false;
    browser_driver::ErrorKind error_kind = browser_driver::ErrorKind::None;
    std::unique_ptr<page::Page> page;
    std::string error_detail;
};

// Create an inert background tab (about:blank), attach to it and enable the
// Page, Runtime and DOM domains. Any failure is an Attach error; whatever was
// created before the failure is torn down before returning.
OpenPageResult open_page(const std::shared_ptr<cdp::Connection> &connection);

// Best-effort teardown; accepts a null page. Never fails.
void close_page(std::unique_ptr<page::Page> &page);

// Closes the held page when it goes out of scope, on every exit path.
class ScopedPage {
public:
    explicit ScopedPage(std::unique_ptr<page::Page> page) : page_(std::move(page)) {}
    ~ScopedPage() { close_page(page_); }

    ScopedPage(const ScopedPage &) = delete;
    ScopedPage &operator=(const ScopedPage &) = delete;

    page::Page &operator*() const { return *page_; }
    page::Page *operator->() const { return page_.get(); }
    page::Page *get() const { return page_.get(); }

private:
    std::unique_ptr<page::Page> page_;
};

} // namespace page_lifecycle

#endif // PAGEPILOT_PAGE_LIFECYCLE_HPP
