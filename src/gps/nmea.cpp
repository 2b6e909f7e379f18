// src/gps/nmea.cpp
#include "gps/nmea.hpp"

#include <cmath>
#include <cstdlib>

namespace gps {

namespace {

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<int> parse_int(const std::string& s) {
    auto v = parse_double(s);
    if (!v || *v != std::floor(*v)) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

int two_digits(const std::string& s, size_t pos) {
    if (pos + 1 >= s.size() || s[pos] < '0' || s[pos] > '9' || s[pos + 1] < '0' || s[pos + 1] > '9') {
        return -1;
    }
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

// Days since 1970-01-01 for a proleptic Gregorian date
long long days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string field(const std::vector<std::string>& f, size_t i) {
    return i < f.size() ? f[i] : std::string();
}

} // namespace

std::optional<NmeaSentence> parse_sentence(const std::string& line) {
    std::string s = line;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) {
        s.pop_back();
    }
    if (s.size() < 7 || (s[0] != '$' && s[0] != '!')) {
        return std::nullopt;
    }

    const size_t star = s.rfind('*');
    if (star == std::string::npos || star + 3 != s.size()) {
        return std::nullopt;
    }
    unsigned char sum = 0;
    for (size_t i = 1; i < star; ++i) {
        sum ^= static_cast<unsigned char>(s[i]);
    }
    const int hi = hex_value(s[star + 1]);
    const int lo = hex_value(s[star + 2]);
    if (hi < 0 || lo < 0 || sum != static_cast<unsigned char>(hi * 16 + lo)) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    std::string cur;
    for (size_t i = 1; i < star; ++i) {
        if (s[i] == ',') {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(s[i]);
        }
    }
    parts.push_back(cur);

    const std::string& address = parts[0];
    if (address.size() < 5) {
        return std::nullopt;
    }

    NmeaSentence out;
    out.talker = address.substr(0, address.size() - 3);
    out.type = address.substr(address.size() - 3);
    out.fields.assign(parts.begin() + 1, parts.end());
    return out;
}

std::optional<double> parse_coordinate(const std::string& value, const std::string& hemisphere) {
    auto v = parse_double(value);
    if (!v || *v < 0.0 || hemisphere.size() != 1) {
        return std::nullopt;
    }
    const double degrees = std::floor(*v / 100.0);
    const double minutes = *v - degrees * 100.0;
    if (minutes >= 60.0) {
        return std::nullopt;
    }
    double deg = degrees + minutes / 60.0;

    switch (hemisphere[0]) {
        case 'N': case 'E': break;
        case 'S': case 'W': deg = -deg; break;
        default: return std::nullopt;
    }
    if ((hemisphere[0] == 'N' || hemisphere[0] == 'S') ? std::abs(deg) > 90.0 : std::abs(deg) > 180.0) {
        return std::nullopt;
    }
    return deg;
}

std::optional<double> parse_utc(const std::string& hhmmss, const std::string& ddmmyy) {
    if (hhmmss.size() < 6 || ddmmyy.size() != 6) {
        return std::nullopt;
    }
    const int hh = two_digits(hhmmss, 0);
    const int mi = two_digits(hhmmss, 2);
    const int ss = two_digits(hhmmss, 4);
    const int dd = two_digits(ddmmyy, 0);
    const int mo = two_digits(ddmmyy, 2);
    const int yy = two_digits(ddmmyy, 4);
    if (hh < 0 || hh > 23 || mi < 0 || mi > 59 || ss < 0 || ss > 60 ||
        dd < 1 || dd > 31 || mo < 1 || mo > 12 || yy < 0) {
        return std::nullopt;
    }

    double frac = 0.0;
    if (hhmmss.size() > 6) {
        auto f = parse_double("0" + hhmmss.substr(6));
        if (!f) {
            return std::nullopt;
        }
        frac = *f;
    }

    // Two-digit year: receivers in service are past 2000
    const long long days = days_from_civil(2000 + yy, mo, dd);
    return static_cast<double>(days * 86400LL + hh * 3600LL + mi * 60LL + ss) + frac;
}

bool NmeaFixTracker::feed(const std::string& line) {
    auto sentence = parse_sentence(line);
    if (!sentence) {
        ++rejected_;
        return false;
    }
    ++parsed_;

    if (sentence->type == "RMC") {
        return apply_rmc(sentence->fields);
    }
    if (sentence->type == "GGA") {
        return apply_gga(sentence->fields);
    }
    return false;
}

bool NmeaFixTracker::apply_rmc(const std::vector<std::string>& f) {
    // time, status, lat, N/S, lon, E/W, speed kn, course, date, ...
    if (field(f, 1) != "A") {
        has_fix_ = false;
        return false;
    }
    auto lat = parse_coordinate(field(f, 2), field(f, 3));
    auto lon = parse_coordinate(field(f, 4), field(f, 5));
    if (!lat || !lon) {
        has_fix_ = false;
        return false;
    }

    fix_.latitude = lat;
    fix_.longitude = lon;
    if (auto knots = parse_double(field(f, 6))) {
        fix_.speed = *knots * kKnotsToMps;
    }
    if (auto course = parse_double(field(f, 7))) {
        fix_.course = *course;
    }
    if (auto t = parse_utc(field(f, 0), field(f, 8))) {
        fix_.fix_time = *t;
    }
    has_fix_ = true;
    return true;
}

bool NmeaFixTracker::apply_gga(const std::vector<std::string>& f) {
    // time, lat, N/S, lon, E/W, quality, satellites, hdop, altitude, M, ...
    auto quality = parse_int(field(f, 5));
    if (!quality || *quality == 0) {
        has_fix_ = false;
        return false;
    }
    auto lat = parse_coordinate(field(f, 1), field(f, 2));
    auto lon = parse_coordinate(field(f, 3), field(f, 4));
    if (!lat || !lon) {
        has_fix_ = false;
        return false;
    }

    fix_.latitude = lat;
    fix_.longitude = lon;
    if (auto sats = parse_int(field(f, 6))) {
        fix_.satellites = *sats;
    }
    if (auto hdop = parse_double(field(f, 7))) {
        fix_.hdop = *hdop;
    }
    if (auto alt = parse_double(field(f, 8))) {
        fix_.altitude = *alt;
    }
    has_fix_ = true;
    return true;
}

std::optional<telemetry::GpsFix> NmeaFixTracker::fix() const {
    if (!has_fix_) {
        return std::nullopt;
    }
    return fix_;
}

} // namespace gps
