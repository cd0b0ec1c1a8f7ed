// Test runner: runs all test suites and reports results.

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// Forward declarations of test functions from other test files.
namespace test_utf8 {
    bool run_all_tests();
}

namespace test_git_repo {
    bool run_all_tests();
}

namespace test_dotfile_queries {
    bool run_all_tests();
}

namespace test_tool_dispatch {
    bool run_all_tests();
}

namespace test_mcp_protocol {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_utf8", test_utf8::run_all_tests},
        {"test_git_repo", test_git_repo::run_all_tests},
        {"test_dotfile_queries", test_dotfile_queries::run_all_tests},
        {"test_tool_dispatch", test_tool_dispatch::run_all_tests},
        {"test_mcp_protocol", test_mcp_protocol::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== dotmcps Test Runner ===" << std::endl;
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
