// src/config/app_config.hpp
#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace config {

struct GeneralConfig {
    std::string log_level = "INFO";
    std::string log_file;                           // empty = stderr only
    double data_interval_s = 10.0;
    std::string device_id_source = "custom";        // custom | mesh_node_id
    std::string custom_device_id;
};

struct CanConfig {
    bool enabled = false;
    std::string interface_type = "socketcan";
    std::string channel = "can0";
    int bitrate = 500000;                           // informational for socketcan
    YAML::Node message_definitions = YAML::Node(YAML::NodeType::Sequence);
    int connection_retries = 3;
    double retry_delay_s = 5.0;
    double receive_timeout_s = 1.0;
    int queue_size = 200;
};

struct MqttConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 1883;
    std::string user;
    std::string password;
    std::string topic_prefix = "vehicle/telemetry";
    std::string data_sub_topic = "sensors";
    double connection_timeout_s = 10.0;
};

struct TraccarConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 5055;                                // OsmAnd
    std::string device_id_source = "device_id";     // device_id | custom_traccar_id
    std::string custom_traccar_id;
    bool use_http = true;
    std::string http_path = "/";
    double report_interval_s = 30.0;
    double request_timeout_s = 10.0;
    bool convert_speed_to_knots = true;
};

struct ObdConfig {
    bool enabled = false;
    std::string channel = "can0";                   // OBD-II over ISO-TP on SocketCAN
    std::vector<std::string> commands = {"RPM", "SPEED", "COOLANT_TEMP",
                                         "FUEL_LEVEL", "ENGINE_LOAD", "THROTTLE_POS"};
    bool include_dtc_codes = true;
    double request_timeout_s = 0.5;
    int connection_retries = 3;
    double retry_delay_s = 5.0;
};

struct GpsConfig {
    bool enabled = false;
    std::string device = "/dev/ttyACM0";            // NMEA 0183 receiver
    int baudrate = 9600;
    double stale_after_s = 5.0;
};

struct MeshConfig {
    bool enabled = false;
    std::string device = "/dev/ttyUSB0";            // Meshtastic node, serial module in TEXTMSG mode
    int baudrate = 115200;
    std::string node_id;                            // !xxxxxxxx, needed for device_id_source=mesh_node_id
    int max_payload_bytes = 233;
};

/**
 * AppConfig - Loads the telemetry hub configuration from a YAML file
 *
 * Usage:
 *   auto cfg = AppConfig::load("config/telemetry_hub.yaml");
 *   cfg.validate();
 *
 * Every key is optional; absent keys keep the defaults above.
 */
class AppConfig {
public:
    GeneralConfig general;
    CanConfig can;
    MqttConfig mqtt;
    TraccarConfig traccar;
    ObdConfig obd;
    GpsConfig gps;
    MeshConfig mesh;

    /**
     * Load config from YAML file
     * @param yaml_path Path to YAML file
     * @return AppConfig with loaded values (not yet validated)
     * @throws std::runtime_error if file exists but is not valid YAML
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static AppConfig load(const std::string& yaml_path);

    // Same as load() but from an in-memory document
    static AppConfig parse(const YAML::Node& root);

    static AppConfig get_default();

    /**
     * Repair invalid values in place instead of failing: bad values fall
     * back to defaults and sinks that cannot work are disabled.
     * @return number of repairs made
     */
    int validate();

    void print_summary() const;

    AppConfig() = default;
};

} // namespace config
