#include "browser/page_lifecycle.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

namespace page_lifecycle {

using browser_driver::CommandResult;
using browser_driver::DriverResult;
using browser_driver::ErrorKind;
using json = nlohmann::json;

OpenPageResult open_page(const std::shared_ptr<cdp::Connection> &connection) {
    OpenPageResult result;

    if (connection == nullptr || !connection->is_open()) {
        result.error_kind = ErrorKind::Attach;
        result.error_detail = "No open CDP connection.";
        return result;
    }

    json create_params;
    create_params["url"] = "about:blank";
    create_params["background"] = true;
    CommandResult create_response = connection->send_command("Target.createTarget", create_params);
    if (!create_response.success || !create_response.result.contains("targetId") ||
        !create_response.result["targetId"].is_string()) {
        result.error_kind = ErrorKind::Attach;
        result.error_detail = create_response.success
                                  ? "Target.createTarget returned no targetId: " + create_response.result.dump()
                                  : create_response.error_detail;
        debug_log::log("open_page: " + result.error_detail);
        return result;
    }

    std::string target_id = create_response.result["targetId"].get<std::string>();
    debug_log::log("open_page: Target.createTarget ok, targetId=" + target_id);

    auto created_page = std::make_unique<page::Page>(connection, target_id);
    DriverResult attach_result = created_page->attach();
    if (!attach_result.success) {
        created_page->close();
        result.error_kind = ErrorKind::Attach;
        result.error_detail = attach_result.error_detail;
        return result;
    }

    result.success = true;
    result.page = std::move(created_page);
    return result;
}

void close_page(std::unique_ptr<page::Page> &page) {
    if (page == nullptr) {
        return;
    }
    page->close();
}

} // namespace page_lifecycle
