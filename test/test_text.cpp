// test/test_text.cpp
// Unit tests for sensor name cleaning, unit conversion and hex parsing

#include "utils/text.hpp"
#include <iostream>
#include <cmath>

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

bool test_clean_basic() {
    TEST_ASSERT(utils::clean_sensor_name("EngineRPM") == "enginerpm", "plain name lower-cased");
    TEST_ASSERT(utils::clean_sensor_name("Coolant Temp (C)") == "coolant_temp_c",
                "spaces and parentheses collapse to single underscores");
    TEST_ASSERT(utils::clean_sensor_name("fuel__level") == "fuel_level", "underscore runs collapse");
    TEST_ASSERT(utils::clean_sensor_name("--speed--") == "speed", "leading/trailing separators trimmed");
    TEST_ASSERT(utils::clean_sensor_name("a.b-c/d") == "a_b_c_d", "punctuation mapped to '_'");
    return true;
}

bool test_clean_degenerate() {
    TEST_ASSERT(utils::clean_sensor_name("") == "unknown_sensor", "empty name gets placeholder");
    TEST_ASSERT(utils::clean_sensor_name("%%%").empty(), "only separators -> empty string");
    TEST_ASSERT(utils::clean_sensor_name("___").empty(), "only underscores -> empty string");
    return true;
}

bool test_knots() {
    TEST_ASSERT(std::abs(utils::mps_to_knots(10.0) - 19.4384) < 1e-9, "10 m/s = 19.4384 kn");
    TEST_ASSERT(std::abs(utils::kph_to_knots(100.0) - 53.9957) < 1e-9, "100 km/h = 53.9957 kn");
    TEST_ASSERT(std::abs(utils::mph_to_knots(60.0) - 52.13856) < 1e-9, "60 mph = 52.13856 kn");
    TEST_ASSERT(utils::mps_to_knots(0.0) == 0.0, "zero stays zero");
    return true;
}

bool test_parse_hex() {
    uint32_t v = 0;
    TEST_ASSERT(utils::parse_hex_u32("0x123", v) && v == 0x123, "0x-prefixed id");
    TEST_ASSERT(utils::parse_hex_u32("0X1a0", v) && v == 0x1A0, "upper-case prefix, lower-case digits");
    TEST_ASSERT(utils::parse_hex_u32("3C0", v) && v == 0x3C0, "bare hex digits");
    TEST_ASSERT(utils::parse_hex_u32("0x1FFFFFFF", v) && v == 0x1FFFFFFF, "29-bit extended id");
    TEST_ASSERT(utils::parse_hex_u32("FFFFFFFF", v) && v == 0xFFFFFFFFu, "32-bit max");

    TEST_ASSERT(!utils::parse_hex_u32("", v), "empty rejected");
    TEST_ASSERT(!utils::parse_hex_u32("0x", v), "prefix only rejected");
    TEST_ASSERT(!utils::parse_hex_u32("0x12G", v), "non-hex digit rejected");
    TEST_ASSERT(!utils::parse_hex_u32(" 0x12", v), "whitespace rejected");
    TEST_ASSERT(!utils::parse_hex_u32("-12", v), "sign rejected");
    TEST_ASSERT(!utils::parse_hex_u32("100000000", v), "overflow rejected");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Text Utility Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_clean_basic);
    RUN_TEST(test_clean_degenerate);
    RUN_TEST(test_knots);
    RUN_TEST(test_parse_hex);

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
