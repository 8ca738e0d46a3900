// Test runner: runs every suite that needs no real browser and reports results.

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// Forward declarations of test functions from other test files.
namespace test_cdp_message {
    bool run_all_tests();
}

namespace test_script_escape {
    bool run_all_tests();
}

namespace test_settings {
    bool run_all_tests();
}

namespace test_chrome_launch {
    bool run_all_tests();
}

namespace test_command_channel {
    bool run_all_tests();
}

namespace test_event_bus {
    bool run_all_tests();
}

namespace test_page {
    bool run_all_tests();
}

namespace test_lookup {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_cdp_message", test_cdp_message::run_all_tests},
        {"test_script_escape", test_script_escape::run_all_tests},
        {"test_settings", test_settings::run_all_tests},
        {"test_chrome_launch", test_chrome_launch::run_all_tests},
        {"test_command_channel", test_command_channel::run_all_tests},
        {"test_event_bus", test_event_bus::run_all_tests},
        {"test_page", test_page::run_all_tests},
        {"test_lookup", test_lookup::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== pagepilot Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
