// pagepilot – drive one browser tab over the Chrome DevTools Protocol.
// Entry point: open a page, navigate, optionally wait/evaluate/read, print JSON, close.
//
// Result JSON goes to stdout; logs go to stderr.

#include <nlohmann/json.hpp>
#include <csignal>
#include <iostream>
#include <string>

#include "browser/browser_endpoint.hpp"
#include "browser/page_lifecycle.hpp"
#include "config/settings.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

namespace {

// Global flag for graceful shutdown, checked between steps.
volatile std::sig_atomic_t shutdown_requested = 0;

void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

struct CommandLine {
    std::string url;
    std::string wait_selector;
    std::string expression;
    std::string text_selector;
    bool print_content = false;
    browser_driver::WaitUntil wait_until = browser_driver::WaitUntil::Load;
};

void print_usage() {
    std::cerr << "usage: pagepilot [options] URL\n"
                 "  --ws URL            connect to a running browser instead of launching Chrome\n"
                 "  --chrome PATH       Chrome executable to launch\n"
                 "  --headed            launch Chrome with a window\n"
                 "  --timeout MS        navigation timeout (default 30000)\n"
                 "  --settle MS         pause after the load event (default 500)\n"
                 "  --wait-until EVENT  load | domcontentloaded (default load)\n"
                 "  --selector CSS      wait until CSS matches before reading\n"
                 "  --eval EXPR         evaluate EXPR in the page\n"
                 "  --text CSS          read the trimmed text of the first CSS match\n"
                 "  --content           print the page HTML\n"
                 "Environment: PAGEPILOT_WS_URL, PAGEPILOT_CHROME, PAGEPILOT_HEADLESS,\n"
                 "  PAGEPILOT_NAVIGATION_TIMEOUT_MS, PAGEPILOT_SETTLE_MS,\n"
                 "  PAGEPILOT_SELECTOR_TIMEOUT_MS, PAGEPILOT_DEBUG\n";
}

// Returns false (after printing why) on a bad command line.
bool parse_command_line(int argc, char **argv, settings::Settings &config, CommandLine &command_line) {
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        auto next_value = [&](std::string &out) {
            if (index + 1 >= argc) {
                std::cerr << "[pagepilot] " << argument << " needs a value." << std::endl;
                return false;
            }
            out = argv[++index];
            return true;
        };
        auto next_milliseconds = [&](int &out) {
            std::string value;
            if (!next_value(value)) {
                return false;
            }
            int parsed = settings::parse_milliseconds(value, -1);
            if (parsed < 0) {
                std::cerr << "[pagepilot] " << argument << " expects milliseconds, got '" << value << "'." << std::endl;
                return false;
            }
            out = parsed;
            return true;
        };

        bool ok = true;
        if (argument == "--ws") {
            ok = next_value(config.websocket_url);
        } else if (argument == "--chrome") {
            ok = next_value(config.chrome_executable);
        } else if (argument == "--headed") {
            config.headless = false;
        } else if (argument == "--timeout") {
            ok = next_milliseconds(config.navigation_timeout_milliseconds);
        } else if (argument == "--settle") {
            ok = next_milliseconds(config.settle_milliseconds);
        } else if (argument == "--wait-until") {
            std::string event_name;
            ok = next_value(event_name);
            if (ok && event_name == "load") {
                command_line.wait_until = browser_driver::WaitUntil::Load;
            } else if (ok && event_name == "domcontentloaded") {
                command_line.wait_until = browser_driver::WaitUntil::DomContentLoaded;
            } else if (ok) {
                std::cerr << "[pagepilot] unknown --wait-until value '" << event_name << "'." << std::endl;
                ok = false;
            }
        } else if (argument == "--selector") {
            ok = next_value(command_line.wait_selector);
        } else if (argument == "--eval") {
            ok = next_value(command_line.expression);
        } else if (argument == "--text") {
            ok = next_value(command_line.text_selector);
        } else if (argument == "--content") {
            command_line.print_content = true;
        } else if (argument == "--help" || argument == "-h") {
            return false;
        } else if (!argument.empty() && argument[0] == '-') {
            std::cerr << "[pagepilot] unknown option " << argument << std::endl;
            ok = false;
        } else if (command_line.url.empty()) {
            command_line.url = argument;
        } else {
            std::cerr << "[pagepilot] unexpected argument " << argument << std::endl;
            ok = false;
        }
        if (!ok) {
            return false;
        }
    }
    if (command_line.url.empty()) {
        std::cerr << "[pagepilot] missing URL." << std::endl;
        return false;
    }
    return true;
}

json failure_json(browser_driver::ErrorKind kind, const std::string &detail) {
    json output;
    output["error_kind"] = browser_driver::error_kind_name(kind);
    output["error"] = detail;
    return output;
}

// Runs the requested steps on an attached page, filling output. Returns false on the first failure.
bool run_steps(page::Page &page, const settings::Settings &config, const CommandLine &command_line, json &output) {
    browser_driver::NavigateOptions navigate_options;
    navigate_options.timeout_milliseconds = config.navigation_timeout_milliseconds;
    navigate_options.settle_milliseconds = config.settle_milliseconds;
    navigate_options.wait_until = command_line.wait_until;

    browser_driver::DriverResult navigate_result = page.go_to(command_line.url, navigate_options);
    if (!navigate_result.success) {
        output = failure_json(navigate_result.error_kind, navigate_result.error_detail);
        return false;
    }

    if (!command_line.wait_selector.empty() && !shutdown_requested) {
        browser_driver::WaitOptions wait_options;
        wait_options.timeout_milliseconds = config.selector_timeout_milliseconds;
        browser_driver::DriverResult wait_result = page.wait_for_selector(command_line.wait_selector, wait_options);
        if (!wait_result.success) {
            output = failure_json(wait_result.error_kind, wait_result.error_detail);
            return false;
        }
    }

    if (!command_line.expression.empty() && !shutdown_requested) {
        browser_driver::EvaluateResult eval_result = page.evaluate(command_line.expression);
        if (!eval_result.success) {
            output = failure_json(eval_result.error_kind, eval_result.error_detail);
            return false;
        }
        output["evaluation"] = eval_result.value;
    }

    if (!command_line.text_selector.empty() && !shutdown_requested) {
        browser_driver::TextResult text_result = page.get_text(command_line.text_selector);
        if (!text_result.success) {
            output = failure_json(text_result.error_kind, text_result.error_detail);
            return false;
        }
        output["text"] = text_result.found ? json(text_result.text) : json(nullptr);
    }

    if (command_line.print_content && !shutdown_requested) {
        browser_driver::TextResult content_result = page.content();
        if (!content_result.success) {
            output = failure_json(content_result.error_kind, content_result.error_detail);
            return false;
        }
        output["content"] = content_result.text;
    }

    browser_driver::TextResult url_result = page.url();
    if (url_result.success && url_result.found) {
        output["url"] = url_result.text;
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    settings::Settings config = settings::load_from_environment();
    CommandLine command_line;
    if (!parse_command_line(argc, argv, config, command_line)) {
        print_usage();
        return 2;
    }

    browser_endpoint::Endpoint endpoint;
    browser_driver::DriverResult endpoint_result = browser_endpoint::open_endpoint(config, endpoint);
    if (!endpoint_result.success) {
        std::cout << failure_json(endpoint_result.error_kind, endpoint_result.error_detail).dump(2) << std::endl;
        debug_log::warn(endpoint_result.message);
        return 1;
    }

    json output = json::object();
    bool succeeded = false;
    {
        page_lifecycle::OpenPageResult opened = page_lifecycle::open_page(endpoint.connection);
        if (!opened.success) {
            output = failure_json(opened.error_kind, opened.error_detail);
        } else {
            page_lifecycle::ScopedPage scoped_page(std::move(opened.page));
            succeeded = run_steps(*scoped_page, config, command_line, output);
        }
    }

    debug_log::log("Closing endpoint (browser process will be killed if launched here).");
    browser_endpoint::close_endpoint(endpoint);

    std::cout << output.dump(2) << std::endl;
    return succeeded ? 0 : 1;
}
