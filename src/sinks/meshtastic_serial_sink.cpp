// src/sinks/meshtastic_serial_sink.cpp
#include "sinks/meshtastic_serial_sink.hpp"
#include "utils/logging.hpp"

#include <cctype>

namespace sinks {

MeshtasticSerialSink::MeshtasticSerialSink(Config config, std::unique_ptr<serial::Stream> stream)
    : config_(std::move(config))
    , stream_(std::move(stream))
{
    if (!config_.node_id.empty() && !is_valid_node_id(config_.node_id)) {
        LOG_WARN("[Mesh] Ignoring malformed node id '%s' (expected !xxxxxxxx)",
                 config_.node_id.c_str());
        config_.node_id.clear();
    }
    if (is_connected()) {
        LOG_INFO("[Mesh] Meshtastic node on %s, payload limit %zu bytes",
                 config_.device.c_str(), config_.max_payload_bytes);
    } else {
        LOG_ERROR("[Mesh] Meshtastic node on %s not available", config_.device.c_str());
    }
}

MeshtasticSerialSink::~MeshtasticSerialSink() {
    if (stream_) {
        stream_->close();
    }
}

bool MeshtasticSerialSink::is_valid_node_id(const std::string& id) {
    if (id.size() != 9 || id[0] != '!') {
        return false;
    }
    for (size_t i = 1; i < id.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> MeshtasticSerialSink::node_id() const {
    if (config_.node_id.empty()) {
        return std::nullopt;
    }
    return config_.node_id;
}

bool MeshtasticSerialSink::send(const telemetry::Snapshot& snapshot) {
    if (!is_connected()) {
        LOG_WARN("[Mesh] Not connected, cannot send");
        return false;
    }

    auto payload = encode_bounded(snapshot, config_.max_payload_bytes);
    if (!payload) {
        LOG_ERROR("[Mesh] Snapshot exceeds the %zu byte mesh limit, not sent",
                  config_.max_payload_bytes);
        return false;
    }

    if (!stream_->write_all(*payload + "\n")) {
        LOG_ERROR("[Mesh] Write to %s failed, closing", config_.device.c_str());
        stream_->close();
        return false;
    }

    ++sent_;
    LOG_DEBUG("[Mesh] Sent %zu bytes", payload->size());
    return true;
}

void MeshtasticSerialSink::close() {
    if (stream_ && stream_->is_open()) {
        stream_->close();
        LOG_INFO("[Mesh] Closed %s", config_.device.c_str());
    }
}

} // namespace sinks
