// src/can/socketcan_iface.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "can/can_bus.hpp"

namespace can {

class SocketCanIface : public CanBus {
public:
    SocketCanIface() = default;
    ~SocketCanIface() override;

    SocketCanIface(const SocketCanIface&) = delete;
    SocketCanIface& operator=(const SocketCanIface&) = delete;

    bool open(const std::string& ifname) override;
    void close() override;

    bool is_open() const override { return sock_ >= 0; }

    /**
     * Wait up to timeout_ms for one frame.
     *
     * Frame   - out holds the frame, id masked to 11 or 29 bits
     * Timeout - nothing arrived (also returned for RTR and error frames,
     *           which carry no signal data)
     * Error   - POLLERR/POLLHUP or a read failure; the socket is unusable
     */
    RxStatus receive(RawFrame& out, int timeout_ms) override;

    // 11-bit frame unless the id needs 29 bits
    bool send(const RawFrame& frame) override;

    // Optional filter: only receive certain 11-bit IDs
    bool set_filters(const std::vector<uint32_t>& ids_11bit);

    // One 11-bit id/mask pair, e.g. 0x7E8/0x7F8 for OBD-II responses
    bool set_mask_filter(uint32_t id, uint32_t mask) override;

    const std::string& ifname() const { return ifname_; }

private:
    int sock_ = -1;
    std::string ifname_;
};

} // namespace can
