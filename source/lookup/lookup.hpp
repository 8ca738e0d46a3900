#ifndef PAGEPILOT_LOOKUP_HPP
#define PAGEPILOT_LOOKUP_HPP

// Fan-out of one lookup over several independent extractors.
// Each extractor gets its own page, opened and closed around it; extractors run
// concurrently and a failing one only turns its own entry into an error.

#include "browser/cdp/cdp_connection.hpp"
#include "browser/driver_types.hpp"
#include "browser/page.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lookup {

using json = nlohmann::json;

// Returns a result object, or { "error": "..." } when it gives up on its own.
using ExtractFunction = std::function<json(page::Page &page)>;

struct Extractor {
    std::string key;         // entry name in the aggregate, e.g. "ipinfo"
    std::string source_name; // name for people, e.g. "IPInfo"
    ExtractFunction extract;
};

// Thrown by require() so extractors can bail out of a chain of page calls.
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(browser_driver::ErrorKind kind, const std::string &detail)
        : std::runtime_error(detail), kind_(kind) {}

    browser_driver::ErrorKind kind() const { return kind_; }

private:
    browser_driver::ErrorKind kind_;
};

// Pass a successful page result through; throw ExtractionError otherwise.
template <typename Result>
const Result &require(const Result &result) {
    if (!result.success) {
        throw ExtractionError(result.error_kind,
                              std::string(browser_driver::error_kind_name(result.error_kind)) + ": " +
                                  result.error_detail);
    }
    return result;
}

// { "error": "Failed to fetch data from <source>: <reason>", "error_type": ..., "message": ... }
json error_entry(const std::string &source_name, const std::string &reason);

// Open a page, run the extractor, close the page exactly once. Never throws for a
// failed open, an error result or a std::exception from the extractor.
json run_extractor(const std::shared_ptr<cdp::Connection> &connection, const Extractor &extractor);

// Run every extractor concurrently; returns { key: result-or-error } for each.
json run_lookup(const std::shared_ptr<cdp::Connection> &connection, const std::vector<Extractor> &extractors);

} // namespace lookup

#endif // PAGEPILOT_LOOKUP_HPP
