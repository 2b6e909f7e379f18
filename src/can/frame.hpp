// src/can/frame.hpp
#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace can {

// Classic CAN frame as handed over by a CanBus
struct RawFrame {
    uint32_t arbitration_id = 0;
    std::array<uint8_t, 8> data{};
    uint8_t size = 0;           // valid bytes in data, 0..8
    double timestamp = 0.0;     // seconds since epoch
};

// One engineering value produced by FrameDecoder
struct DecodedSample {
    double timestamp = 0.0;
    std::string name;
    double value = 0.0;
};

} // namespace can
