/**
 * @file test_main.cpp
 * @brief FactorLab unit test runner
 *
 * Runs every suite in order; the first failed assertion aborts the run with
 * a non-zero exit code.
 */

#include "TestHarness.hpp"
#include <factorlab/Logging.hpp>
#include <iostream>
#include <string>

int main() {
    std::cout << "\n" << std::string(50, '=') << "\n";
    std::cout << "FactorLab C++ Unit Tests\n";
    std::cout << std::string(50, '=') << "\n\n";

    // Degenerate-input warnings are expected in several tests
    factorlab::set_log_level(spdlog::level::err);

    try {
        std::cout << "-- Quantile bucketer --\n";
        run_bucketer_tests();

        std::cout << "\n-- Return linking & performance stats --\n";
        run_returns_tests();

        std::cout << "\n-- Transaction costs --\n";
        run_cost_tests();

        std::cout << "\n-- Mean-variance optimizer --\n";
        run_optimizer_tests();

        std::cout << "\n-- Factor backtester --\n";
        run_backtester_tests();

        std::cout << "\n" << std::string(50, '=') << "\n";
        std::cout << "All tests passed! ✅\n";
        std::cout << std::string(50, '=') << "\n\n";

        return 0;
    } catch (const factorlab::test::TestFailure& e) {
        std::cerr << "\n❌ " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
