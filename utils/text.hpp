#pragma once
#include <cstdint>
#include <string>

namespace utils
{

    // Non-word characters become '_', runs collapse, leading/trailing '_'
    // are trimmed and the result is lower-cased. Empty -> "unknown_sensor".
    std::string clean_sensor_name(const std::string &name);

    constexpr double kKphToKnots = 0.539957;
    constexpr double kMphToKnots = 0.868976;
    constexpr double kMpsToKnots = 1.94384;

    inline double kph_to_knots(double kph) { return kph * kKphToKnots; }
    inline double mph_to_knots(double mph) { return mph * kMphToKnots; }
    inline double mps_to_knots(double mps) { return mps * kMpsToKnots; }

    // Strict hexadecimal parse, optional 0x/0X prefix, no sign or whitespace
    bool parse_hex_u32(const std::string &s, uint32_t &out);

    std::string to_lower(std::string s);

} // namespace utils
