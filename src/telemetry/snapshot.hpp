// src/telemetry/snapshot.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace telemetry {

/**
 * Position fix as reported by the position source.
 * Every field is optional; receivers differ in what they report.
 */
struct GpsFix {
    std::optional<double> latitude;     // deg
    std::optional<double> longitude;    // deg
    std::optional<double> altitude;     // m
    std::optional<double> speed;        // m/s
    std::optional<double> course;       // deg, 0 = north
    std::optional<int> satellites;
    std::optional<double> hdop;
    std::optional<double> fix_time;     // unix seconds

    // No field reported at all
    bool empty() const {
        return !latitude && !longitude && !altitude && !speed && !course &&
               !satellites && !hdop && !fix_time;
    }

    // lat and lon present and not both exactly 0.0
    bool has_valid_position() const {
        if (!latitude || !longitude)
            return false;
        return !(*latitude == 0.0 && *longitude == 0.0);
    }
};

// Sensor name -> reading; nullopt when the source answered without a value
using SensorMap = std::map<std::string, std::optional<double>>;

// Bus signal name -> latest decoded value
using SignalValues = std::map<std::string, double>;

struct DiagnosticReading {
    SensorMap sensors;
    std::vector<std::string> dtcs;
};

/**
 * Snapshot - one aggregation cycle, handed to every sink by const reference.
 */
struct Snapshot {
    double timestamp_utc = 0.0;
    std::string device_id;

    SensorMap sensors;
    std::optional<GpsFix> gps;
    std::vector<std::string> dtcs;
    SignalValues bus_signals;

    // Nothing worth dispatching
    bool empty() const {
        return sensors.empty() && (!gps || gps->empty()) && dtcs.empty() && bus_signals.empty();
    }
};

} // namespace telemetry
