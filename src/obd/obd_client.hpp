// src/obd/obd_client.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "can/can_bus.hpp"
#include "obd/obd_pids.hpp"
#include "telemetry/collaborators.hpp"
#include "utils/stop_signal.hpp"

namespace obd {

// Functional broadcast request id and the ECU response range (ISO 15765-4, 11-bit)
constexpr uint32_t kBroadcastRequestId = 0x7DF;
constexpr uint32_t kFirstResponseId = 0x7E8;
constexpr uint32_t kLastResponseId = 0x7EF;
constexpr uint32_t kResponseToRequestOffset = 0x8;

/**
 * ObdClient - OBD-II diagnostics over ISO-TP on a SocketCAN channel.
 *
 * connect() opens the bus and asks the ECUs which service 01 PIDs they
 * support; configured commands the vehicle does not support are dropped
 * with a warning. read() polls each remaining PID once and, when enabled,
 * the stored trouble codes (service 03, multi-frame capable).
 *
 * Keys in the returned sensor map are the lower-cased command names
 * ("rpm", "coolant_temp"); a PID that does not answer maps to nullopt.
 */
class ObdClient : public telemetry::DiagnosticSource {
public:
    struct Config {
        std::string channel = "can0";
        std::vector<std::string> commands;
        bool include_dtc_codes = true;
        double request_timeout_s = 0.5;
        int connection_retries = 3;
        double retry_delay_s = 5.0;
    };

    ObdClient(Config config, can::BusFactory factory, std::shared_ptr<utils::StopSignal> stop);
    ~ObdClient() override;

    ObdClient(const ObdClient&) = delete;
    ObdClient& operator=(const ObdClient&) = delete;

    /**
     * Open the bus and query the ECU, retrying with retry_delay_s between
     * attempts. A stop request abandons the remaining attempts.
     * @return true once an ECU answered the supported-PID query
     */
    bool connect();

    bool is_connected() const override { return connected_; }
    telemetry::DiagnosticReading read() override;
    void close() override;

    // Commands that passed the support check, in configured order
    std::vector<std::string> active_commands() const;

    /**
     * One request/response exchange.
     * @return response payload starting at the service byte (0x41, 0x43, ...)
     */
    std::optional<std::vector<uint8_t>> query(uint8_t service, std::optional<uint8_t> pid);

private:
    bool discover_supported();
    bool send_request(uint8_t service, std::optional<uint8_t> pid);
    bool send_flow_control(uint32_t response_id);
    void drop_connection(const char* reason);

    Config config_;
    can::BusFactory factory_;
    std::shared_ptr<utils::StopSignal> stop_;

    std::unique_ptr<can::CanBus> bus_;
    bool connected_ = false;
    SupportedPids supported_;
    std::vector<const PidInfo*> active_;
};

} // namespace obd
