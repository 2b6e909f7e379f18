// test/test_frame_decoder.cpp
/**
 * Unit Test: FrameDecoder
 *
 * Test Coverage:
 *   1. Single unsigned big-endian signal (0x123 engine speed)
 *   2. Two signals sharing one frame, signed + unsigned
 *   3. Little-endian and signed two's complement fields
 *   4. Frame too short for one of its signals
 *   5. Unknown frame id / disjoint signals / full 8-byte field
 */

#include "can/frame_decoder.hpp"
#include "can/signal_catalog.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <cmath>
#include <initializer_list>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

bool is_close(double actual, double expected, double tolerance = 1e-6) {
    return std::abs(actual - expected) < tolerance;
}

can::SignalDefinition make_signal(uint32_t id, const std::string& name,
                                  int start_byte, int length_bytes,
                                  double scale, double offset,
                                  bool is_signed, can::ByteOrder order) {
    can::SignalDefinition def;
    def.frame_id = id;
    def.signal_name = name;
    def.start_byte = start_byte;
    def.length_bytes = length_bytes;
    def.scale = scale;
    def.offset = offset;
    def.is_signed = is_signed;
    def.byte_order = order;
    return def;
}

can::RawFrame make_frame(uint32_t id, std::initializer_list<uint8_t> bytes, double ts = 1000.0) {
    can::RawFrame frame;
    frame.arbitration_id = id;
    frame.timestamp = ts;
    uint8_t i = 0;
    for (uint8_t b : bytes) {
        if (i >= 8) break;
        frame.data[i++] = b;
    }
    frame.size = i;
    return frame;
}

// Test 1: engine speed on 0x123
void test_single_unsigned(TestResult& result) {
    std::cout << "\n=== Test 1: Unsigned Big-Endian Signal ===\n";

    can::SignalCatalog catalog;
    catalog.add(make_signal(0x123, "EngineRPM", 0, 2, 0.25, 0.0, false, can::ByteOrder::Big));

    auto samples = can::FrameDecoder::decode(make_frame(0x123, {0x01, 0x2C}, 42.5), catalog);

    if (samples.size() == 1) {
        result.pass("One sample decoded");
    } else {
        result.fail("Expected 1 sample, got " + std::to_string(samples.size()));
        return;
    }

    if (samples[0].name == "EngineRPM" && is_close(samples[0].value, 75.0)) {
        result.pass("0x012C * 0.25 = 75.0");
    } else {
        result.fail("EngineRPM = " + std::to_string(samples[0].value) + " (expected 75.0)");
    }

    if (is_close(samples[0].timestamp, 42.5)) {
        result.pass("Sample carries the frame timestamp");
    } else {
        result.fail("Timestamp not propagated");
    }
}

// Test 2: two signals on 0x1A0
void test_shared_frame(TestResult& result) {
    std::cout << "\n=== Test 2: Signed + Unsigned On One Frame ===\n";

    can::SignalCatalog catalog;
    catalog.add(make_signal(0x1A0, "SteeringAngle", 2, 2, 0.1, -3276.8, true, can::ByteOrder::Big));
    catalog.add(make_signal(0x1A0, "ThrottlePct", 0, 1, 0.5, 0.0, false, can::ByteOrder::Big));

    auto samples = can::FrameDecoder::decode(
        make_frame(0x1A0, {0x50, 0x00, 0x0C, 0x7B, 0x00, 0x00, 0x00, 0x00}), catalog);

    if (samples.size() != 2) {
        result.fail("Expected 2 samples, got " + std::to_string(samples.size()));
        return;
    }

    if (samples[0].name == "SteeringAngle" && samples[1].name == "ThrottlePct") {
        result.pass("Samples follow catalog order");
    } else {
        result.fail("Samples out of catalog order");
    }

    if (is_close(samples[0].value, -2957.3, 1e-3)) {
        result.pass("SteeringAngle = 3195 * 0.1 - 3276.8 = -2957.3");
    } else {
        result.fail("SteeringAngle = " + std::to_string(samples[0].value));
    }

    if (is_close(samples[1].value, 40.0)) {
        result.pass("ThrottlePct = 0x50 * 0.5 = 40.0");
    } else {
        result.fail("ThrottlePct = " + std::to_string(samples[1].value));
    }
}

// Test 3: byte order and two's complement
void test_byte_order_and_sign(TestResult& result) {
    std::cout << "\n=== Test 3: Byte Order And Sign Extension ===\n";

    can::SignalCatalog catalog;
    catalog.add(make_signal(0x200, "LittleU16", 0, 2, 1.0, 0.0, false, can::ByteOrder::Little));
    catalog.add(make_signal(0x200, "BigS16", 2, 2, 1.0, 0.0, true, can::ByteOrder::Big));
    catalog.add(make_signal(0x200, "LittleS16", 4, 2, 0.5, 10.0, true, can::ByteOrder::Little));
    catalog.add(make_signal(0x200, "SignedByte", 6, 1, 1.0, 0.0, true, can::ByteOrder::Big));
    catalog.add(make_signal(0x200, "UnsignedByte", 6, 1, 1.0, 0.0, false, can::ByteOrder::Big));

    auto samples = can::FrameDecoder::decode(
        make_frame(0x200, {0x2C, 0x01, 0xFF, 0xFE, 0x00, 0x80, 0x80, 0x00}), catalog);

    if (samples.size() != 5) {
        result.fail("Expected 5 samples, got " + std::to_string(samples.size()));
        return;
    }

    if (is_close(samples[0].value, 300.0)) {
        result.pass("Little-endian [2C 01] = 300");
    } else {
        result.fail("LittleU16 = " + std::to_string(samples[0].value));
    }

    if (is_close(samples[1].value, -2.0)) {
        result.pass("Big-endian signed [FF FE] = -2");
    } else {
        result.fail("BigS16 = " + std::to_string(samples[1].value));
    }

    // [00 80] little = 0x8000 = -32768 -> -32768 * 0.5 + 10
    if (is_close(samples[2].value, -16374.0)) {
        result.pass("Little-endian signed [00 80] * 0.5 + 10 = -16374");
    } else {
        result.fail("LittleS16 = " + std::to_string(samples[2].value));
    }

    if (is_close(samples[3].value, -128.0) && is_close(samples[4].value, 128.0)) {
        result.pass("Overlapping ranges decode independently (0x80 = -128 / 128)");
    } else {
        result.fail("Overlapping byte decoded as " + std::to_string(samples[3].value) +
                    " / " + std::to_string(samples[4].value));
    }
}

// Test 4: DLC shorter than the definition
void test_short_frame(TestResult& result) {
    std::cout << "\n=== Test 4: Frame Too Short ===\n";

    can::SignalCatalog catalog;
    catalog.add(make_signal(0x300, "Head", 0, 1, 1.0, 0.0, false, can::ByteOrder::Big));
    catalog.add(make_signal(0x300, "Tail", 4, 2, 1.0, 0.0, false, can::ByteOrder::Big));

    auto samples = can::FrameDecoder::decode(make_frame(0x300, {0x07, 0x00, 0x00}), catalog);

    if (samples.size() == 1 && samples[0].name == "Head" && is_close(samples[0].value, 7.0)) {
        result.pass("Only the unsatisfiable signal is dropped");
    } else {
        result.fail("Short frame handling wrong (" + std::to_string(samples.size()) + " samples)");
    }

    auto empty = can::FrameDecoder::decode(make_frame(0x300, {}), catalog);
    if (empty.empty()) {
        result.pass("Zero-length payload yields no samples");
    } else {
        result.fail("Zero-length payload produced samples");
    }
}

// Test 5: misc
void test_misc(TestResult& result) {
    std::cout << "\n=== Test 5: Unknown Id, Disjoint Signals, 64-bit Field ===\n";

    can::SignalCatalog catalog;
    catalog.add(make_signal(0x400, "A", 0, 2, 1.0, 0.0, false, can::ByteOrder::Big));
    catalog.add(make_signal(0x400, "B", 2, 2, 1.0, 0.0, false, can::ByteOrder::Little));
    catalog.add(make_signal(0x500, "Wide", 0, 8, 1.0, 0.0, true, can::ByteOrder::Big));

    if (can::FrameDecoder::decode(make_frame(0x7FF, {1, 2, 3}), catalog).empty()) {
        result.pass("Unknown frame id yields nothing");
    } else {
        result.fail("Unknown frame id produced samples");
    }

    auto ab = can::FrameDecoder::decode(make_frame(0x400, {0x12, 0x34, 0x56, 0x78}), catalog);
    if (ab.size() == 2 && is_close(ab[0].value, 0x1234) && is_close(ab[1].value, 0x7856)) {
        result.pass("Disjoint signals decode independently (0x1234, 0x7856)");
    } else {
        result.fail("Disjoint signal decode wrong");
    }

    auto wide = can::FrameDecoder::decode(
        make_frame(0x500, {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}), catalog);
    if (wide.size() == 1 && is_close(wide[0].value, -1.0)) {
        result.pass("8-byte signed all-ones = -1");
    } else {
        result.fail("8-byte signed decode wrong");
    }

    if (can::FrameDecoder::sign_extend(0x7F, 8) == 127 &&
        can::FrameDecoder::sign_extend(0xFF, 8) == -1 &&
        can::FrameDecoder::sign_extend(0x800000, 24) == -8388608) {
        result.pass("sign_extend at 8 and 24 bits");
    } else {
        result.fail("sign_extend wrong");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              FrameDecoder Unit Tests                         ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;

    test_single_unsigned(result);
    test_shared_frame(result);
    test_byte_order_and_sign(result);
    test_short_frame(result);
    test_misc(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
