// test/test_rate_limiter.cpp
// Unit tests for the interval gate used by the tracking sink

#include "utils/rate_limiter.hpp"
#include <iostream>
#include <cmath>
#include <memory>
#include <stdexcept>

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

// Manual clock shared with the limiter under test
struct ManualClock {
    std::shared_ptr<double> now = std::make_shared<double>(1000.0);
    utils::RateLimiter::ClockFn fn() const {
        auto t = now;
        return [t] { return *t; };
    }
    void advance(double s) { *now += s; }
};

bool test_rejects_bad_interval() {
    bool threw = false;
    try {
        utils::RateLimiter limiter(0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "zero interval throws");

    threw = false;
    try {
        utils::RateLimiter limiter(-5.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "negative interval throws");

    threw = false;
    try {
        utils::RateLimiter limiter(std::nan(""));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "NaN interval throws");
    return true;
}

bool test_first_trigger_succeeds() {
    ManualClock clock;
    utils::RateLimiter limiter(30.0, clock.fn());
    TEST_ASSERT(std::isinf(limiter.time_since_last_trigger()), "never triggered -> +inf");
    TEST_ASSERT(limiter.time_to_next_trigger() == 0.0, "never triggered -> ready now");
    TEST_ASSERT(limiter.try_trigger(), "first trigger succeeds");
    TEST_ASSERT(limiter.interval() == 30.0, "interval reported");
    return true;
}

bool test_interval_enforced() {
    ManualClock clock;
    utils::RateLimiter limiter(30.0, clock.fn());
    TEST_ASSERT(limiter.try_trigger(), "t=0 triggers");

    int granted = 0;
    for (int i = 0; i < 5; ++i) {
        clock.advance(5.0);
        if (limiter.try_trigger())
            ++granted;
    }
    TEST_ASSERT(granted == 0, "five attempts 5s apart all rejected");
    TEST_ASSERT(std::abs(limiter.time_since_last_trigger() - 25.0) < 1e-9, "25s since trigger");
    TEST_ASSERT(std::abs(limiter.time_to_next_trigger() - 5.0) < 1e-9, "5s until next");

    clock.advance(5.0);
    TEST_ASSERT(limiter.try_trigger(), "exactly one interval later triggers");
    TEST_ASSERT(!limiter.try_trigger(), "immediate retry rejected");
    return true;
}

bool test_rejection_does_not_move_window() {
    ManualClock clock;
    utils::RateLimiter limiter(10.0, clock.fn());
    limiter.try_trigger();
    clock.advance(9.0);
    TEST_ASSERT(!limiter.try_trigger(), "rejected at 9s");
    clock.advance(1.0);
    TEST_ASSERT(limiter.try_trigger(), "rejection did not push the window back");
    return true;
}

bool test_reset() {
    ManualClock clock;
    utils::RateLimiter limiter(60.0, clock.fn());
    limiter.try_trigger();
    TEST_ASSERT(!limiter.try_trigger(), "throttled before reset");
    limiter.reset();
    TEST_ASSERT(limiter.time_to_next_trigger() == 0.0, "reset -> ready now");
    TEST_ASSERT(limiter.try_trigger(), "trigger after reset");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "RateLimiter Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_rejects_bad_interval);
    RUN_TEST(test_first_trigger_succeeds);
    RUN_TEST(test_interval_enforced);
    RUN_TEST(test_rejection_does_not_move_window);
    RUN_TEST(test_reset);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
