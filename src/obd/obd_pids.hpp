// src/obd/obd_pids.hpp
#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace obd {

// SAE J1979 service ids
constexpr uint8_t kServiceCurrentData = 0x01;
constexpr uint8_t kServiceStoredDtcs = 0x03;
constexpr uint8_t kPositiveResponseOffset = 0x40;
constexpr uint8_t kNegativeResponse = 0x7F;

/**
 * One service 01 parameter.
 * `decode` receives the data bytes A, B, ... following the PID echo.
 */
struct PidInfo {
    const char* name;       // upper case, e.g. "COOLANT_TEMP"
    uint8_t pid;
    uint8_t bytes;
    const char* unit;
    double (*decode)(const uint8_t* d);
};

const std::vector<PidInfo>& pid_table();

// Case-insensitive lookup by name; nullptr if unknown
const PidInfo* find_pid(const std::string& name);

/**
 * Supported-PID bitmaps (PIDs 0x00, 0x20, 0x40, ...).
 * Bit 7 of the first data byte is PID base+1.
 */
using SupportedPids = std::bitset<256>;
void mark_supported(uint8_t base_pid, const uint8_t* d, size_t len, SupportedPids& out);

// Two raw bytes -> "P0301"; empty string for the 0x0000 filler
std::string decode_dtc(uint8_t a, uint8_t b);

// Byte pairs -> codes, fillers skipped, odd trailing byte ignored
std::vector<std::string> decode_dtc_list(const uint8_t* d, size_t len);

// Two decimals, matching what sinks display
double round2(double v);

} // namespace obd
