// src/obd/obd_pids.cpp
#include "obd/obd_pids.hpp"

#include <cctype>
#include <cmath>

namespace obd {

namespace {

double word(const uint8_t* d) { return 256.0 * d[0] + d[1]; }
double percent(const uint8_t* d) { return d[0] * 100.0 / 255.0; }
double temperature(const uint8_t* d) { return d[0] - 40.0; }
double fuel_trim(const uint8_t* d) { return (d[0] - 128.0) * 100.0 / 128.0; }
double raw_byte(const uint8_t* d) { return d[0]; }

} // namespace

const std::vector<PidInfo>& pid_table() {
    static const std::vector<PidInfo> table = {
        {"ENGINE_LOAD",              0x04, 1, "%",    percent},
        {"COOLANT_TEMP",             0x05, 1, "degC", temperature},
        {"SHORT_FUEL_TRIM_1",        0x06, 1, "%",    fuel_trim},
        {"LONG_FUEL_TRIM_1",         0x07, 1, "%",    fuel_trim},
        {"FUEL_PRESSURE",            0x0A, 1, "kPa",  [](const uint8_t* d) { return 3.0 * d[0]; }},
        {"INTAKE_PRESSURE",          0x0B, 1, "kPa",  raw_byte},
        {"RPM",                      0x0C, 2, "rpm",  [](const uint8_t* d) { return word(d) / 4.0; }},
        {"SPEED",                    0x0D, 1, "kph",  raw_byte},
        {"TIMING_ADVANCE",           0x0E, 1, "deg",  [](const uint8_t* d) { return d[0] / 2.0 - 64.0; }},
        {"INTAKE_TEMP",              0x0F, 1, "degC", temperature},
        {"MAF",                      0x10, 2, "g/s",  [](const uint8_t* d) { return word(d) / 100.0; }},
        {"THROTTLE_POS",             0x11, 1, "%",    percent},
        {"RUN_TIME",                 0x1F, 2, "s",    word},
        {"FUEL_LEVEL",               0x2F, 1, "%",    percent},
        {"DISTANCE_SINCE_DTC_CLEAR", 0x31, 2, "km",   word},
        {"BAROMETRIC_PRESSURE",      0x33, 1, "kPa",  raw_byte},
        {"CONTROL_MODULE_VOLTAGE",   0x42, 2, "V",    [](const uint8_t* d) { return word(d) / 1000.0; }},
        {"AMBIENT_AIR_TEMP",         0x46, 1, "degC", temperature},
        {"OIL_TEMP",                 0x5C, 1, "degC", temperature},
        {"FUEL_RATE",                0x5E, 2, "L/h",  [](const uint8_t* d) { return word(d) / 20.0; }},
    };
    return table;
}

const PidInfo* find_pid(const std::string& name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    for (const auto& info : pid_table()) {
        if (upper == info.name) {
            return &info;
        }
    }
    return nullptr;
}

void mark_supported(uint8_t base_pid, const uint8_t* d, size_t len, SupportedPids& out) {
    const size_t n = len < 4 ? len : 4;
    for (size_t byte = 0; byte < n; ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            if (d[byte] & (0x80 >> bit)) {
                const size_t pid = base_pid + byte * 8 + bit + 1;
                if (pid < out.size()) {
                    out.set(pid);
                }
            }
        }
    }
}

std::string decode_dtc(uint8_t a, uint8_t b) {
    if (a == 0 && b == 0) {
        return std::string();
    }
    static const char kSystems[] = {'P', 'C', 'B', 'U'};
    static const char kHex[] = "0123456789ABCDEF";

    std::string code(5, '0');
    code[0] = kSystems[(a >> 6) & 0x03];
    code[1] = kHex[(a >> 4) & 0x03];
    code[2] = kHex[a & 0x0F];
    code[3] = kHex[(b >> 4) & 0x0F];
    code[4] = kHex[b & 0x0F];
    return code;
}

std::vector<std::string> decode_dtc_list(const uint8_t* d, size_t len) {
    std::vector<std::string> codes;
    for (size_t i = 0; i + 1 < len; i += 2) {
        std::string code = decode_dtc(d[i], d[i + 1]);
        if (!code.empty()) {
            codes.push_back(code);
        }
    }
    return codes;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace obd
