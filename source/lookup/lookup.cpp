#include "lookup/lookup.hpp"
#include "browser/page_lifecycle.hpp"
#include "lookup/error_classify.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <future>

namespace lookup {

json error_entry(const std::string &source_name, const std::string &reason) {
    error_classify::ErrorType type = error_classify::classify_error(reason);
    json entry;
    entry["error"] = "Failed to fetch data from " + source_name + ": " + reason;
    entry["error_type"] = error_classify::error_type_name(type);
    entry["message"] = error_classify::user_friendly_message(type, source_name);
    return entry;
}

json run_extractor(const std::shared_ptr<cdp::Connection> &connection, const Extractor &extractor) {
    page_lifecycle::OpenPageResult opened = page_lifecycle::open_page(connection);
    if (!opened.success) {
        return error_entry(extractor.source_name,
                           std::string(browser_driver::error_kind_name(opened.error_kind)) + ": " +
                               opened.error_detail);
    }

    page_lifecycle::ScopedPage scoped_page(std::move(opened.page));
    json extracted;
    try {
        extracted = extractor.extract(*scoped_page);
    } catch (const std::exception &error) {
        debug_log::log(extractor.source_name + " extractor failed: " + error.what());
        return error_entry(extractor.source_name, error.what());
    }

    if (extracted.is_object() && extracted.contains("error") && extracted["error"].is_string()) {
        debug_log::log(extractor.source_name + " extractor returned error: " + extracted["error"].get<std::string>());
        return error_entry(extractor.source_name, extracted["error"].get<std::string>());
    }
    return extracted;
}

json run_lookup(const std::shared_ptr<cdp::Connection> &connection, const std::vector<Extractor> &extractors) {
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::future<json>> pending_results;
    pending_results.reserve(extractors.size());
    for (const auto &extractor : extractors) {
        pending_results.push_back(std::async(std::launch::async, [&connection, &extractor] {
            return run_extractor(connection, extractor);
        }));
    }

    json results = json::object();
    for (size_t index = 0; index < extractors.size(); ++index) {
        results[extractors[index].key] = pending_results[index].get();
    }

    long elapsed_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
    debug_log::log("run_lookup: " + std::to_string(extractors.size()) + " extractors finished in " +
                   std::to_string(elapsed_milliseconds) + " ms");
    return results;
}

} // namespace lookup
