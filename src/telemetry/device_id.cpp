// src/telemetry/device_id.cpp
#include "telemetry/device_id.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace telemetry {

namespace {

std::string fallback_id(double now_unix_s) {
    return "fallback_" + std::to_string(static_cast<long long>(std::floor(now_unix_s)));
}

} // namespace

std::string resolve_device_id(const config::GeneralConfig& general,
                              const MeshSink* mesh,
                              double now_unix_s) {
    if (general.device_id_source == "custom") {
        if (!general.custom_device_id.empty()) {
            LOG_INFO("[DeviceId] Using custom device id '%s'", general.custom_device_id.c_str());
            return general.custom_device_id;
        }
        LOG_WARN("[DeviceId] device_id_source is 'custom' but custom_device_id is empty");
    } else if (general.device_id_source == "mesh_node_id") {
        if (mesh) {
            try {
                if (mesh->is_connected()) {
                    auto node = mesh->node_id();
                    if (node && !node->empty()) {
                        LOG_INFO("[DeviceId] Using mesh node id '%s'", node->c_str());
                        return *node;
                    }
                    LOG_ERROR("[DeviceId] Mesh sink connected but reported no node id");
                } else {
                    LOG_WARN("[DeviceId] Mesh sink not connected");
                }
            } catch (const std::exception& e) {
                LOG_ERROR("[DeviceId] Mesh node id query failed: %s", e.what());
            }
        } else {
            LOG_WARN("[DeviceId] device_id_source is 'mesh_node_id' but no mesh sink is available");
        }
    } else {
        LOG_WARN("[DeviceId] Unknown device_id_source '%s'", general.device_id_source.c_str());
    }

    const std::string id = fallback_id(now_unix_s);
    LOG_WARN("[DeviceId] Using fallback device id '%s'", id.c_str());
    return id;
}

std::string resolve_tracking_id(const config::TraccarConfig& traccar,
                                const std::string& device_id) {
    if (traccar.device_id_source == "custom_traccar_id") {
        if (!traccar.custom_traccar_id.empty()) {
            return traccar.custom_traccar_id;
        }
        LOG_WARN("[DeviceId] Traccar id source is 'custom_traccar_id' but none given, using '%s'",
                 device_id.c_str());
    }
    return device_id;
}

bool is_fallback_id(const std::string& id) {
    return id.rfind("fallback_", 0) == 0;
}

} // namespace telemetry
