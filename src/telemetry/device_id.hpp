// src/telemetry/device_id.hpp
#pragma once

#include <string>

#include "config/app_config.hpp"
#include "telemetry/collaborators.hpp"

namespace telemetry {

/**
 * Device id for snapshots:
 *   custom        -> general.custom_device_id when non-empty
 *   mesh_node_id  -> node id of a connected mesh sink
 *   otherwise     -> "fallback_<unix seconds>" (logged as a warning)
 */
std::string resolve_device_id(const config::GeneralConfig& general,
                              const MeshSink* mesh,
                              double now_unix_s);

// Id presented to the tracking server
std::string resolve_tracking_id(const config::TraccarConfig& traccar,
                                const std::string& device_id);

bool is_fallback_id(const std::string& id);

} // namespace telemetry
