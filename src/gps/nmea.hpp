// src/gps/nmea.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "telemetry/snapshot.hpp"

namespace gps {

constexpr double kKnotsToMps = 0.514444;

// "$GNRMC,..." split after checksum verification
struct NmeaSentence {
    std::string talker;                 // "GP", "GN", ...
    std::string type;                   // "RMC", "GGA", ...
    std::vector<std::string> fields;    // everything after the address field
};

/**
 * Parse one line. Trailing CR/LF is ignored. The "*hh" checksum is
 * mandatory; a line without one or with a mismatch yields nullopt.
 */
std::optional<NmeaSentence> parse_sentence(const std::string& line);

// ddmm.mmmm + hemisphere -> signed decimal degrees
std::optional<double> parse_coordinate(const std::string& value, const std::string& hemisphere);

// hhmmss(.sss) + ddmmyy -> unix seconds (UTC)
std::optional<double> parse_utc(const std::string& hhmmss, const std::string& ddmmyy);

/**
 * NmeaFixTracker - folds RMC and GGA sentences into one GpsFix.
 *
 * RMC contributes position, speed (m/s), course and fix time; GGA adds
 * altitude, satellites and HDOP. An RMC with status V or a GGA with fix
 * quality 0 drops the fix until the receiver reports one again.
 */
class NmeaFixTracker {
public:
    // True when the line was a valid sentence that refreshed a usable fix
    bool feed(const std::string& line);

    bool has_fix() const { return has_fix_; }

    // Current fix; nullopt while the receiver has none
    std::optional<telemetry::GpsFix> fix() const;

    size_t sentences_parsed() const { return parsed_; }
    size_t sentences_rejected() const { return rejected_; }

private:
    bool apply_rmc(const std::vector<std::string>& f);
    bool apply_gga(const std::vector<std::string>& f);

    telemetry::GpsFix fix_;
    bool has_fix_ = false;
    size_t parsed_ = 0;
    size_t rejected_ = 0;
};

} // namespace gps
