// src/sinks/mqtt_publisher.hpp
#pragma once

#include <memory>
#include <string>

#include "telemetry/collaborators.hpp"

namespace sinks {

/**
 * MQTT publisher on top of libcurl's mqtt:// scheme.
 *
 * Each publish is a short CONNECT/PUBLISH/DISCONNECT exchange at QoS 0.
 * Topics are <topic_prefix>/<device_id>/<sub_topic>; the payload is the
 * snapshot JSON. A device id that is empty or a fallback id leaves the
 * publisher unconfigured, since topics would change on every restart.
 */
class MqttPublisher : public telemetry::MessageBusSink {
public:
    struct Config {
        bool enabled = false;
        std::string host = "localhost";
        int port = 1883;
        std::string user;
        std::string password;
        std::string topic_prefix = "vehicle/telemetry";
        std::string status_sub_topic = "status";
        double connection_timeout_s = 10.0;
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialised
     */
    MqttPublisher(const Config& config, std::string device_id);
    ~MqttPublisher() override;

    MqttPublisher(const MqttPublisher&) = delete;
    MqttPublisher& operator=(const MqttPublisher&) = delete;

    bool is_configured() const { return configured_ && !closed_; }

    // Outcome of the last publish; true right after configuration
    bool is_connected() const override { return is_configured() && last_ok_; }

    bool publish(const telemetry::Snapshot& snapshot, const std::string& sub_topic) override;

    // Raw payload to <prefix>/<device>/<sub_topic>
    bool publish_raw(const std::string& sub_topic, const std::string& payload);

    // "online" / "offline" on the status sub-topic
    bool publish_status(bool online);

    // Publishes "offline" once, then refuses further publishes
    void close() override;

    std::string topic_for(const std::string& sub_topic) const;
    std::string url_for(const std::string& topic) const;

private:
    Config config_;
    std::string device_id_;
    bool configured_ = false;
    bool closed_ = false;
    bool last_ok_ = true;
    bool announced_online_ = false;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sinks
