/**
 * @file TestHarness.hpp
 * @brief Minimal test macros shared by the FactorLab unit tests
 *
 * Failed assertions throw TestFailure, so tests still fail in builds that
 * define NDEBUG.
 */

#pragma once

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace factorlab::test {

class TestFailure : public std::runtime_error {
public:
    explicit TestFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace factorlab::test

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    test_##name(); \
    std::cout << "✅ PASSED\n"; \
} while(0)

#define ASSERT_NEAR(a, b, eps) do { \
    const double assert_a_ = (a); \
    const double assert_b_ = (b); \
    if (!(std::abs(assert_a_ - assert_b_) <= (eps))) { \
        std::ostringstream assert_os_; \
        assert_os_ << __FILE__ << ":" << __LINE__ << ": ASSERT_NEAR failed: " \
                   << assert_a_ << " != " << assert_b_ << " (eps=" << (eps) << ")"; \
        throw factorlab::test::TestFailure(assert_os_.str()); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::ostringstream assert_os_; \
        assert_os_ << __FILE__ << ":" << __LINE__ << ": ASSERT_TRUE failed: " #cond; \
        throw factorlab::test::TestFailure(assert_os_.str()); \
    } \
} while(0)

#define ASSERT_THROWS(expr, exception_type) do { \
    bool assert_thrown_ = false; \
    try { \
        (void)(expr); \
    } catch (const exception_type&) { \
        assert_thrown_ = true; \
    } \
    if (!assert_thrown_) { \
        std::ostringstream assert_os_; \
        assert_os_ << __FILE__ << ":" << __LINE__ << ": ASSERT_THROWS failed: " #expr \
                   << " did not throw " #exception_type; \
        throw factorlab::test::TestFailure(assert_os_.str()); \
    } \
} while(0)

// Suite entry points, one per test source
void run_bucketer_tests();
void run_returns_tests();
void run_cost_tests();
void run_optimizer_tests();
void run_backtester_tests();
