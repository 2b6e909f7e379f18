// src/obd/obd_client.cpp
#include "obd/obd_client.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"
#include "utils/text.hpp"

#include <algorithm>
#include <stdexcept>

namespace obd {

namespace {

constexpr uint8_t kPadByte = 0x55;
constexpr size_t kMaxStaleFrames = 64;

// ISO-TP frame types (upper nibble of the first byte)
constexpr uint8_t kSingleFrame = 0x0;
constexpr uint8_t kFirstFrame = 0x1;
constexpr uint8_t kConsecutiveFrame = 0x2;
constexpr uint8_t kFlowControlClearToSend = 0x30;

bool is_response_id(uint32_t id) {
    return id >= kFirstResponseId && id <= kLastResponseId;
}

bool matches(const std::vector<uint8_t>& payload, uint8_t expected_service, std::optional<uint8_t> pid) {
    if (payload.empty() || payload[0] != expected_service) {
        return false;
    }
    return !pid || (payload.size() >= 2 && payload[1] == *pid);
}

can::RawFrame padded_frame(uint32_t id) {
    can::RawFrame frame;
    frame.arbitration_id = id;
    frame.size = 8;
    frame.data.fill(kPadByte);
    return frame;
}

} // namespace

ObdClient::ObdClient(Config config, can::BusFactory factory, std::shared_ptr<utils::StopSignal> stop)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , stop_(std::move(stop))
{
    if (!factory_ || !stop_) {
        throw std::invalid_argument("ObdClient requires a bus factory and a stop signal");
    }
    if (!(config_.request_timeout_s > 0.0)) {
        throw std::invalid_argument("ObdClient request timeout must be positive");
    }
}

ObdClient::~ObdClient() {
    if (bus_) {
        bus_->close();
    }
}

bool ObdClient::connect() {
    close();

    const int attempts = config_.connection_retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        LOG_INFO("[OBD] Connecting on %s (attempt %d/%d)", config_.channel.c_str(), attempt, attempts);

        try {
            std::unique_ptr<can::CanBus> bus = factory_();
            if (bus && bus->open(config_.channel)) {
                if (!bus->set_mask_filter(kFirstResponseId, 0x7F8)) {
                    LOG_DEBUG("[OBD] No kernel filter, response ids checked in software");
                }
                bus_ = std::move(bus);
                if (discover_supported()) {
                    connected_ = true;
                    LOG_INFO("[OBD] Connected on %s, %zu of %zu commands active",
                             config_.channel.c_str(), active_.size(), config_.commands.size());
                    return true;
                }
                LOG_WARN("[OBD] No ECU answered on %s (ignition off?)", config_.channel.c_str());
                if (bus_) {
                    bus_->close();
                    bus_.reset();
                }
            } else {
                LOG_ERROR("[OBD] Could not open %s (attempt %d)", config_.channel.c_str(), attempt);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[OBD] Unexpected error on %s (attempt %d): %s",
                      config_.channel.c_str(), attempt, e.what());
            bus_.reset();
        }

        if (attempt < attempts) {
            LOG_INFO("[OBD] Retrying in %.1f s", config_.retry_delay_s);
            if (stop_->wait_for(config_.retry_delay_s)) {
                LOG_INFO("[OBD] Connection retry aborted by stop request");
                break;
            }
        }
    }

    LOG_ERROR("[OBD] Failed to connect on %s", config_.channel.c_str());
    return false;
}

bool ObdClient::discover_supported() {
    supported_.reset();
    active_.clear();

    bool answered = false;
    uint8_t base = 0x00;
    while (true) {
        auto resp = query(kServiceCurrentData, base);
        if (!resp || resp->size() < 6) {
            break;
        }
        answered = true;
        mark_supported(base, resp->data() + 2, resp->size() - 2, supported_);

        // Each bitmap announces whether the next one exists; stop after PID 0x60
        const uint8_t next = static_cast<uint8_t>(base + 0x20);
        if (base >= 0x40 || !supported_.test(next)) {
            break;
        }
        base = next;
    }
    if (!answered || !bus_) {
        return false;
    }

    for (const auto& name : config_.commands) {
        const PidInfo* info = find_pid(name);
        if (!info) {
            LOG_WARN("[OBD] Command '%s' is not a known service 01 PID", name.c_str());
        } else if (!supported_.test(info->pid)) {
            LOG_WARN("[OBD] Command '%s' (PID 0x%02X) not supported by the vehicle",
                     info->name, info->pid);
        } else {
            active_.push_back(info);
        }
    }
    if (active_.empty() && !config_.commands.empty()) {
        LOG_WARN("[OBD] None of the configured commands is supported");
    }
    return true;
}

std::vector<std::string> ObdClient::active_commands() const {
    std::vector<std::string> names;
    names.reserve(active_.size());
    for (const PidInfo* info : active_) {
        names.emplace_back(info->name);
    }
    return names;
}

bool ObdClient::send_request(uint8_t service, std::optional<uint8_t> pid) {
    can::RawFrame frame = padded_frame(kBroadcastRequestId);
    frame.data[0] = pid ? 2 : 1;
    frame.data[1] = service;
    if (pid) {
        frame.data[2] = *pid;
    }
    return bus_->send(frame);
}

bool ObdClient::send_flow_control(uint32_t response_id) {
    can::RawFrame frame = padded_frame(response_id - kResponseToRequestOffset);
    frame.data[0] = kFlowControlClearToSend;
    frame.data[1] = 0x00;   // no block limit
    frame.data[2] = 0x00;   // no separation time
    return bus_->send(frame);
}

void ObdClient::drop_connection(const char* reason) {
    LOG_ERROR("[OBD] Connection lost: %s", reason);
    connected_ = false;
    if (bus_) {
        bus_->close();
        bus_.reset();
    }
}

std::optional<std::vector<uint8_t>> ObdClient::query(uint8_t service, std::optional<uint8_t> pid) {
    if (!bus_ || !bus_->is_open()) {
        return std::nullopt;
    }

    // Late answers from other ECUs to the previous request
    can::RawFrame frame;
    for (size_t i = 0; i < kMaxStaleFrames; ++i) {
        const can::RxStatus st = bus_->receive(frame, 0);
        if (st == can::RxStatus::Error) {
            drop_connection("bus error");
            return std::nullopt;
        }
        if (st == can::RxStatus::Timeout) {
            break;
        }
    }

    if (!send_request(service, pid)) {
        drop_connection("request could not be sent");
        return std::nullopt;
    }

    const uint8_t expected = static_cast<uint8_t>(service + kPositiveResponseOffset);
    const double deadline = utils::monotonic_seconds() + config_.request_timeout_s;

    std::vector<uint8_t> payload;
    size_t expected_len = 0;
    uint32_t source_id = 0;     // ECU whose multi-frame answer is being assembled
    uint8_t next_seq = 1;

    while (true) {
        const double remaining = deadline - utils::monotonic_seconds();
        if (remaining <= 0.0) {
            break;
        }
        const int timeout_ms = std::max(1, static_cast<int>(remaining * 1000.0));
        const can::RxStatus st = bus_->receive(frame, timeout_ms);
        if (st == can::RxStatus::Error) {
            drop_connection("bus error");
            return std::nullopt;
        }
        if (st == can::RxStatus::Timeout || !is_response_id(frame.arbitration_id) || frame.size < 1) {
            continue;
        }

        const uint8_t frame_type = frame.data[0] >> 4;

        if (source_id != 0) {
            if (frame.arbitration_id != source_id || frame_type != kConsecutiveFrame) {
                continue;
            }
            if ((frame.data[0] & 0x0F) != next_seq) {
                LOG_WARN("[OBD] Out-of-sequence frame from 0x%03X", source_id);
                return std::nullopt;
            }
            next_seq = static_cast<uint8_t>((next_seq + 1) & 0x0F);
            for (size_t i = 1; i < frame.size && payload.size() < expected_len; ++i) {
                payload.push_back(frame.data[i]);
            }
            if (payload.size() >= expected_len) {
                return payload;
            }
            continue;
        }

        if (frame_type == kSingleFrame) {
            const size_t len = frame.data[0] & 0x0F;
            if (len == 0 || len + 1 > frame.size) {
                continue;
            }
            std::vector<uint8_t> single(frame.data.begin() + 1, frame.data.begin() + 1 + len);
            if (single[0] == kNegativeResponse) {
                if (single.size() >= 2 && single[1] == service) {
                    LOG_DEBUG("[OBD] ECU 0x%03X rejected service 0x%02X", frame.arbitration_id, service);
                    return std::nullopt;
                }
                continue;
            }
            if (matches(single, expected, pid)) {
                return single;
            }
        } else if (frame_type == kFirstFrame) {
            if (frame.size < 8) {
                continue;
            }
            expected_len = (static_cast<size_t>(frame.data[0] & 0x0F) << 8) | frame.data[1];
            payload.assign(frame.data.begin() + 2, frame.data.begin() + 8);
            if (expected_len < payload.size() || !matches(payload, expected, pid)) {
                payload.clear();
                continue;
            }
            source_id = frame.arbitration_id;
            next_seq = 1;
            if (!send_flow_control(source_id)) {
                drop_connection("flow control could not be sent");
                return std::nullopt;
            }
        }
    }

    if (pid) {
        LOG_DEBUG("[OBD] No answer to service 0x%02X PID 0x%02X", service, *pid);
    } else {
        LOG_DEBUG("[OBD] No answer to service 0x%02X", service);
    }
    return std::nullopt;
}

telemetry::DiagnosticReading ObdClient::read() {
    telemetry::DiagnosticReading reading;
    if (!connected_) {
        LOG_WARN("[OBD] Not connected, cannot read data");
        return reading;
    }

    for (const PidInfo* info : active_) {
        const std::string key = utils::to_lower(info->name);
        std::optional<std::vector<uint8_t>> resp;
        if (connected_) {
            resp = query(kServiceCurrentData, info->pid);
        }
        if (resp && resp->size() >= 2u + info->bytes) {
            const double value = round2(info->decode(resp->data() + 2));
            reading.sensors[key] = value;
            LOG_DEBUG("[OBD] %s = %.2f %s", info->name, value, info->unit);
        } else {
            reading.sensors[key] = std::nullopt;
        }
    }

    if (config_.include_dtc_codes && connected_) {
        auto resp = query(kServiceStoredDtcs, std::nullopt);
        // On CAN the service byte is followed by a DTC count
        if (resp && resp->size() >= 2) {
            reading.dtcs = decode_dtc_list(resp->data() + 2, resp->size() - 2);
            if (!reading.dtcs.empty()) {
                std::string joined;
                for (const auto& code : reading.dtcs) {
                    joined += (joined.empty() ? "" : ",") + code;
                }
                LOG_INFO("[OBD] DTCs: %s", joined.c_str());
            }
        }
    }
    return reading;
}

void ObdClient::close() {
    connected_ = false;
    if (bus_) {
        bus_->close();
        bus_.reset();
        LOG_INFO("[OBD] Connection closed");
    }
}

} // namespace obd
