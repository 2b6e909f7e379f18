// src/config/app_config.cpp
#include "config/app_config.hpp"
#include "serial/serial_port.hpp"
#include "sinks/meshtastic_serial_sink.hpp"
#include "utils/logging.hpp"

#include <fstream>
#include <stdexcept>

namespace config {

namespace {

// Node-or-default with a type check; a present but mistyped value is logged
// and the default kept.
template <typename T>
T read_or(const YAML::Node& section, const char* key, const T& fallback, const char* section_name) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        LOG_WARN("[AppConfig] %s.%s has the wrong type, using default", section_name, key);
        return fallback;
    }
}

// LoRa payload of a Meshtastic text message
constexpr int kMinMeshPayloadBytes = 16;
constexpr int kMaxMeshPayloadBytes = 237;

} // namespace

AppConfig AppConfig::get_default() {
    return AppConfig();
}

AppConfig AppConfig::parse(const YAML::Node& root) {
    AppConfig cfg;

    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("[AppConfig] Top level of config must be a map");
    }

    // ====================================================================
    // general
    // ====================================================================
    if (root["general"]) {
        auto g = root["general"];
        auto& out = cfg.general;
        out.log_level = read_or<std::string>(g, "log_level", out.log_level, "general");
        out.log_file = read_or<std::string>(g, "log_file", out.log_file, "general");
        out.data_interval_s = read_or<double>(g, "data_interval_seconds", out.data_interval_s, "general");
        out.device_id_source = read_or<std::string>(g, "device_id_source", out.device_id_source, "general");
        out.custom_device_id = read_or<std::string>(g, "custom_device_id", out.custom_device_id, "general");
    }

    // ====================================================================
    // can
    // ====================================================================
    if (root["can"]) {
        auto c = root["can"];
        auto& out = cfg.can;
        out.enabled = read_or<bool>(c, "enabled", out.enabled, "can");
        out.interface_type = read_or<std::string>(c, "interface_type", out.interface_type, "can");
        out.channel = read_or<std::string>(c, "channel", out.channel, "can");
        out.bitrate = read_or<int>(c, "bitrate", out.bitrate, "can");
        if (c["message_definitions"]) {
            out.message_definitions = YAML::Clone(c["message_definitions"]);
        }
        out.connection_retries = read_or<int>(c, "connection_retries", out.connection_retries, "can");
        out.retry_delay_s = read_or<double>(c, "retry_delay_seconds", out.retry_delay_s, "can");
        out.receive_timeout_s = read_or<double>(c, "receive_timeout_seconds", out.receive_timeout_s, "can");
        out.queue_size = read_or<int>(c, "queue_size", out.queue_size, "can");
    }

    // ====================================================================
    // mqtt
    // ====================================================================
    if (root["mqtt"]) {
        auto m = root["mqtt"];
        auto& out = cfg.mqtt;
        out.enabled = read_or<bool>(m, "enabled", out.enabled, "mqtt");
        out.host = read_or<std::string>(m, "host", out.host, "mqtt");
        out.port = read_or<int>(m, "port", out.port, "mqtt");
        out.user = read_or<std::string>(m, "user", out.user, "mqtt");
        out.password = read_or<std::string>(m, "password", out.password, "mqtt");
        out.topic_prefix = read_or<std::string>(m, "topic_prefix", out.topic_prefix, "mqtt");
        out.data_sub_topic = read_or<std::string>(m, "data_sub_topic", out.data_sub_topic, "mqtt");
        out.connection_timeout_s =
            read_or<double>(m, "connection_timeout_seconds", out.connection_timeout_s, "mqtt");
    }

    // ====================================================================
    // traccar
    // ====================================================================
    if (root["traccar"]) {
        auto t = root["traccar"];
        auto& out = cfg.traccar;
        out.enabled = read_or<bool>(t, "enabled", out.enabled, "traccar");
        out.host = read_or<std::string>(t, "host", out.host, "traccar");
        out.port = read_or<int>(t, "port", out.port, "traccar");
        out.device_id_source = read_or<std::string>(t, "device_id_source", out.device_id_source, "traccar");
        out.custom_traccar_id = read_or<std::string>(t, "custom_traccar_id", out.custom_traccar_id, "traccar");
        out.use_http = read_or<bool>(t, "use_http", out.use_http, "traccar");
        out.http_path = read_or<std::string>(t, "http_path", out.http_path, "traccar");
        out.report_interval_s = read_or<double>(t, "report_interval_seconds", out.report_interval_s, "traccar");
        out.request_timeout_s = read_or<double>(t, "request_timeout_seconds", out.request_timeout_s, "traccar");
        out.convert_speed_to_knots =
            read_or<bool>(t, "convert_speed_to_knots", out.convert_speed_to_knots, "traccar");
    }

    // ====================================================================
    // obd
    // ====================================================================
    if (root["obd"]) {
        auto o = root["obd"];
        auto& out = cfg.obd;
        out.enabled = read_or<bool>(o, "enabled", out.enabled, "obd");
        out.channel = read_or<std::string>(o, "channel", out.channel, "obd");
        out.commands = read_or<std::vector<std::string>>(o, "commands", out.commands, "obd");
        out.include_dtc_codes = read_or<bool>(o, "include_dtc_codes", out.include_dtc_codes, "obd");
        out.request_timeout_s = read_or<double>(o, "request_timeout_seconds", out.request_timeout_s, "obd");
        out.connection_retries = read_or<int>(o, "connection_retries", out.connection_retries, "obd");
        out.retry_delay_s = read_or<double>(o, "retry_delay_seconds", out.retry_delay_s, "obd");
    }

    // ====================================================================
    // gps
    // ====================================================================
    if (root["gps"]) {
        auto g = root["gps"];
        auto& out = cfg.gps;
        out.enabled = read_or<bool>(g, "enabled", out.enabled, "gps");
        out.device = read_or<std::string>(g, "device", out.device, "gps");
        out.baudrate = read_or<int>(g, "baudrate", out.baudrate, "gps");
        out.stale_after_s = read_or<double>(g, "stale_after_seconds", out.stale_after_s, "gps");
    }

    // ====================================================================
    // mesh
    // ====================================================================
    if (root["mesh"]) {
        auto m = root["mesh"];
        auto& out = cfg.mesh;
        out.enabled = read_or<bool>(m, "enabled", out.enabled, "mesh");
        out.device = read_or<std::string>(m, "device", out.device, "mesh");
        out.baudrate = read_or<int>(m, "baudrate", out.baudrate, "mesh");
        out.node_id = read_or<std::string>(m, "node_id", out.node_id, "mesh");
        out.max_payload_bytes = read_or<int>(m, "max_payload_bytes", out.max_payload_bytes, "mesh");
    }

    return cfg;
}

AppConfig AppConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[AppConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[AppConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[AppConfig] Loading config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        AppConfig cfg = parse(root);
        LOG_INFO("[AppConfig] Successfully loaded: %s", yaml_path.c_str());
        return cfg;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[AppConfig] YAML parse error: ") + e.what()
        );
    }
}

int AppConfig::validate() {
    int repairs = 0;
    const AppConfig defaults = get_default();

    if (!(general.data_interval_s > 0.0)) {
        LOG_WARN("[AppConfig] Invalid general.data_interval_seconds %.3f, using %.0f",
                 general.data_interval_s, defaults.general.data_interval_s);
        general.data_interval_s = defaults.general.data_interval_s;
        ++repairs;
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(general.log_level, lvl)) {
        LOG_WARN("[AppConfig] Invalid log level '%s', defaulting to INFO", general.log_level.c_str());
        general.log_level = "INFO";
        ++repairs;
    } else {
        general.log_level = utils::to_string(lvl);
    }

    if (general.device_id_source != "custom" && general.device_id_source != "mesh_node_id") {
        LOG_WARN("[AppConfig] Unknown general.device_id_source '%s', using 'custom'",
                 general.device_id_source.c_str());
        general.device_id_source = "custom";
        ++repairs;
    }

    // CAN
    if (can.enabled) {
        if (!can.message_definitions.IsSequence()) {
            LOG_WARN("[AppConfig] can.message_definitions is not a list. Disabling CAN.");
            can.enabled = false;
            ++repairs;
        }
        if (can.channel.empty() || can.interface_type.empty()) {
            LOG_WARN("[AppConfig] CAN interface_type or channel not specified. Disabling CAN.");
            can.enabled = false;
            ++repairs;
        }
        if (can.enabled && can.interface_type != "socketcan") {
            LOG_WARN("[AppConfig] CAN interface_type '%s' not supported. Disabling CAN.",
                     can.interface_type.c_str());
            can.enabled = false;
            ++repairs;
        }
    }
    if (can.connection_retries < 0) {
        LOG_WARN("[AppConfig] Invalid can.connection_retries, using %d", defaults.can.connection_retries);
        can.connection_retries = defaults.can.connection_retries;
        ++repairs;
    }
    if (!(can.retry_delay_s > 0.0)) {
        LOG_WARN("[AppConfig] Invalid can.retry_delay_seconds, using %.0f", defaults.can.retry_delay_s);
        can.retry_delay_s = defaults.can.retry_delay_s;
        ++repairs;
    }
    if (!(can.receive_timeout_s > 0.0)) {
        LOG_WARN("[AppConfig] Invalid can.receive_timeout_seconds, using %.1f", defaults.can.receive_timeout_s);
        can.receive_timeout_s = defaults.can.receive_timeout_s;
        ++repairs;
    }
    if (can.queue_size <= 0) {
        LOG_WARN("[AppConfig] Invalid can.queue_size, using %d", defaults.can.queue_size);
        can.queue_size = defaults.can.queue_size;
        ++repairs;
    }

    // MQTT
    if (mqtt.enabled) {
        if (mqtt.host.empty()) {
            LOG_WARN("[AppConfig] MQTT host not specified. Disabling MQTT.");
            mqtt.enabled = false;
            ++repairs;
        } else if (mqtt.port <= 0 || mqtt.port > 65535) {
            LOG_WARN("[AppConfig] MQTT port %d is invalid. Disabling MQTT.", mqtt.port);
            mqtt.enabled = false;
            ++repairs;
        }
    }
    if (mqtt.data_sub_topic.empty()) {
        mqtt.data_sub_topic = defaults.mqtt.data_sub_topic;
        ++repairs;
    }
    if (!(mqtt.connection_timeout_s > 0.0)) {
        mqtt.connection_timeout_s = defaults.mqtt.connection_timeout_s;
        ++repairs;
    }

    // Traccar
    if (traccar.enabled) {
        if (traccar.host.empty()) {
            LOG_WARN("[AppConfig] Traccar host not specified. Disabling Traccar.");
            traccar.enabled = false;
            ++repairs;
        } else if (traccar.port <= 0 || traccar.port > 65535) {
            LOG_WARN("[AppConfig] Traccar port %d is invalid. Disabling Traccar.", traccar.port);
            traccar.enabled = false;
            ++repairs;
        }
    }
    if (traccar.device_id_source != "device_id" && traccar.device_id_source != "custom_traccar_id") {
        LOG_WARN("[AppConfig] Unknown traccar.device_id_source '%s', using 'device_id'",
                 traccar.device_id_source.c_str());
        traccar.device_id_source = defaults.traccar.device_id_source;
        ++repairs;
    }
    if (!(traccar.report_interval_s > 0.0)) {
        LOG_WARN("[AppConfig] Invalid traccar.report_interval_seconds, using %.0f",
                 defaults.traccar.report_interval_s);
        traccar.report_interval_s = defaults.traccar.report_interval_s;
        ++repairs;
    }
    if (!(traccar.request_timeout_s > 0.0)) {
        traccar.request_timeout_s = defaults.traccar.request_timeout_s;
        ++repairs;
    }
    if (traccar.http_path.empty() || traccar.http_path[0] != '/') {
        traccar.http_path = "/" + traccar.http_path;
        ++repairs;
    }

    // OBD
    if (obd.enabled && obd.channel.empty()) {
        LOG_WARN("[AppConfig] OBD channel not specified. Disabling OBD.");
        obd.enabled = false;
        ++repairs;
    }
    if (obd.enabled && obd.commands.empty()) {
        LOG_WARN("[AppConfig] obd.commands is empty, only DTCs will be read");
    }
    if (!(obd.request_timeout_s > 0.0)) {
        obd.request_timeout_s = defaults.obd.request_timeout_s;
        ++repairs;
    }
    if (obd.connection_retries < 0) {
        obd.connection_retries = defaults.obd.connection_retries;
        ++repairs;
    }
    if (!(obd.retry_delay_s > 0.0)) {
        obd.retry_delay_s = defaults.obd.retry_delay_s;
        ++repairs;
    }

    // GPS
    if (gps.enabled && gps.device.empty()) {
        LOG_WARN("[AppConfig] GPS device not specified. Disabling GPS.");
        gps.enabled = false;
        ++repairs;
    }
    if (!serial::is_supported_baudrate(gps.baudrate)) {
        LOG_WARN("[AppConfig] Unsupported gps.baudrate %d, using %d", gps.baudrate, defaults.gps.baudrate);
        gps.baudrate = defaults.gps.baudrate;
        ++repairs;
    }
    if (!(gps.stale_after_s > 0.0)) {
        gps.stale_after_s = defaults.gps.stale_after_s;
        ++repairs;
    }

    // Mesh
    if (mesh.enabled && mesh.device.empty()) {
        LOG_WARN("[AppConfig] Mesh device not specified. Disabling mesh.");
        mesh.enabled = false;
        ++repairs;
    }
    if (!serial::is_supported_baudrate(mesh.baudrate)) {
        LOG_WARN("[AppConfig] Unsupported mesh.baudrate %d, using %d", mesh.baudrate, defaults.mesh.baudrate);
        mesh.baudrate = defaults.mesh.baudrate;
        ++repairs;
    }
    if (!mesh.node_id.empty() && !sinks::MeshtasticSerialSink::is_valid_node_id(mesh.node_id)) {
        LOG_WARN("[AppConfig] mesh.node_id '%s' is not of the form !xxxxxxxx, ignoring",
                 mesh.node_id.c_str());
        mesh.node_id.clear();
        ++repairs;
    }
    if (mesh.max_payload_bytes < kMinMeshPayloadBytes || mesh.max_payload_bytes > kMaxMeshPayloadBytes) {
        LOG_WARN("[AppConfig] mesh.max_payload_bytes %d out of range [%d, %d], using %d",
                 mesh.max_payload_bytes, kMinMeshPayloadBytes, kMaxMeshPayloadBytes,
                 defaults.mesh.max_payload_bytes);
        mesh.max_payload_bytes = defaults.mesh.max_payload_bytes;
        ++repairs;
    }

    if (repairs == 0) {
        LOG_DEBUG("[AppConfig] Validation passed");
    } else {
        LOG_INFO("[AppConfig] Validation repaired %d value(s)", repairs);
    }
    return repairs;
}

void AppConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Telemetry Hub Configuration");
    LOG_INFO("========================================");
    LOG_INFO("Log level: %s%s%s", general.log_level.c_str(),
             general.log_file.empty() ? "" : " -> ", general.log_file.c_str());
    LOG_INFO("Data interval: %.1f s", general.data_interval_s);
    LOG_INFO("Device id source: %s", general.device_id_source.c_str());
    LOG_INFO("----------------------------------------");
    if (can.enabled) {
        LOG_INFO("CAN: %s on %s (%zu definitions, queue %d)",
                 can.interface_type.c_str(), can.channel.c_str(),
                 can.message_definitions.IsSequence() ? can.message_definitions.size() : size_t(0),
                 can.queue_size);
    } else {
        LOG_INFO("CAN: disabled");
    }
    if (mqtt.enabled) {
        LOG_INFO("MQTT: %s:%d prefix=%s", mqtt.host.c_str(), mqtt.port, mqtt.topic_prefix.c_str());
    } else {
        LOG_INFO("MQTT: disabled");
    }
    if (traccar.enabled) {
        LOG_INFO("Traccar: %s:%d%s every %.0f s", traccar.host.c_str(), traccar.port,
                 traccar.http_path.c_str(), traccar.report_interval_s);
    } else {
        LOG_INFO("Traccar: disabled");
    }
    if (obd.enabled) {
        LOG_INFO("OBD: %s (%zu PIDs%s)", obd.channel.c_str(), obd.commands.size(),
                 obd.include_dtc_codes ? " + DTCs" : "");
    } else {
        LOG_INFO("OBD: disabled");
    }
    if (gps.enabled) {
        LOG_INFO("GPS: %s @ %d baud", gps.device.c_str(), gps.baudrate);
    } else {
        LOG_INFO("GPS: disabled");
    }
    if (mesh.enabled) {
        LOG_INFO("Mesh: %s @ %d baud node=%s", mesh.device.c_str(), mesh.baudrate,
                 mesh.node_id.empty() ? "(unset)" : mesh.node_id.c_str());
    } else {
        LOG_INFO("Mesh: disabled");
    }
    LOG_INFO("========================================");
}

} // namespace config
