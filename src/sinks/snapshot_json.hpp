// src/sinks/snapshot_json.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "telemetry/snapshot.hpp"

namespace sinks {

// Default mesh payload limit (bytes)
constexpr size_t kMeshMaxPayloadBytes = 233;

/**
 * {
 *   "timestamp_utc": 1718000000.5,
 *   "device_id": "truck_07",
 *   "sensors": {"RPM": 2500, "FUEL": null},
 *   "gps": {"latitude": ..., "longitude": ...},   // {} without a fix
 *   "dtcs": ["P0101"],
 *   "can_data": {"EngineRPM": 75.0}
 * }
 */
nlohmann::json snapshot_to_json(const telemetry::Snapshot& snapshot);

// Compact dump
std::string encode(const telemetry::Snapshot& snapshot);

// Compact dump, or nothing if it is longer than max_bytes
std::optional<std::string> encode_bounded(const telemetry::Snapshot& snapshot,
                                          size_t max_bytes = kMeshMaxPayloadBytes);

} // namespace sinks
