// src/sinks/snapshot_json.cpp
#include "sinks/snapshot_json.hpp"
#include "utils/logging.hpp"

namespace sinks {

namespace {

template <typename T>
void put_if(nlohmann::json& obj, const char* key, const std::optional<T>& v) {
    if (v) {
        obj[key] = *v;
    }
}

nlohmann::json gps_to_json(const std::optional<telemetry::GpsFix>& gps) {
    nlohmann::json out = nlohmann::json::object();
    if (!gps) {
        return out;
    }
    put_if(out, "latitude", gps->latitude);
    put_if(out, "longitude", gps->longitude);
    put_if(out, "altitude", gps->altitude);
    put_if(out, "speed", gps->speed);
    put_if(out, "course", gps->course);
    put_if(out, "satellites", gps->satellites);
    put_if(out, "hdop", gps->hdop);
    put_if(out, "fix_time", gps->fix_time);
    return out;
}

} // namespace

nlohmann::json snapshot_to_json(const telemetry::Snapshot& snapshot) {
    nlohmann::json sensors = nlohmann::json::object();
    for (const auto& kv : snapshot.sensors) {
        if (kv.second) {
            sensors[kv.first] = *kv.second;
        } else {
            sensors[kv.first] = nullptr;
        }
    }

    nlohmann::json can_data = nlohmann::json::object();
    for (const auto& kv : snapshot.bus_signals) {
        can_data[kv.first] = kv.second;
    }

    return nlohmann::json{
        {"timestamp_utc", snapshot.timestamp_utc},
        {"device_id", snapshot.device_id},
        {"sensors", sensors},
        {"gps", gps_to_json(snapshot.gps)},
        {"dtcs", snapshot.dtcs},
        {"can_data", can_data},
    };
}

std::string encode(const telemetry::Snapshot& snapshot) {
    return snapshot_to_json(snapshot).dump();
}

std::optional<std::string> encode_bounded(const telemetry::Snapshot& snapshot, size_t max_bytes) {
    std::string payload = encode(snapshot);
    if (payload.size() > max_bytes) {
        LOG_WARN("[Payload] Snapshot is %zu bytes, limit is %zu", payload.size(), max_bytes);
        return std::nullopt;
    }
    return payload;
}

} // namespace sinks
