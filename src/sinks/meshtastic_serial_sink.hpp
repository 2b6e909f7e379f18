// src/sinks/meshtastic_serial_sink.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "serial/serial_port.hpp"
#include "sinks/snapshot_json.hpp"
#include "telemetry/collaborators.hpp"

namespace sinks {

/**
 * Mesh sink for a Meshtastic node whose serial module runs in TEXTMSG
 * mode: each line written to the node's serial port is broadcast as a
 * text message on the primary channel.
 *
 * Snapshots are sent as one compact JSON line. Payloads longer than
 * max_payload_bytes are refused (send() returns false, nothing written).
 * The node id ("!" + 8 hex digits, as shown by the Meshtastic app) comes
 * from configuration since TEXTMSG mode does not expose it.
 */
class MeshtasticSerialSink : public telemetry::MeshSink {
public:
    struct Config {
        std::string device = "/dev/ttyUSB0";
        std::string node_id;
        size_t max_payload_bytes = kMeshMaxPayloadBytes;
    };

    /**
     * @param stream  opened by the caller; a null or closed stream leaves
     *                the sink disconnected
     */
    MeshtasticSerialSink(Config config, std::unique_ptr<serial::Stream> stream);
    ~MeshtasticSerialSink() override;

    MeshtasticSerialSink(const MeshtasticSerialSink&) = delete;
    MeshtasticSerialSink& operator=(const MeshtasticSerialSink&) = delete;

    bool is_connected() const override { return stream_ && stream_->is_open(); }
    bool send(const telemetry::Snapshot& snapshot) override;
    void close() override;

    std::optional<std::string> node_id() const override;

    static bool is_valid_node_id(const std::string& id);

    size_t messages_sent() const { return sent_; }

private:
    Config config_;
    std::unique_ptr<serial::Stream> stream_;
    size_t sent_ = 0;
};

} // namespace sinks
