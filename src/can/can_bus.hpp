// src/can/can_bus.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "can/frame.hpp"

namespace can {

enum class RxStatus {
    Frame,    // out was filled
    Timeout,  // nothing within the timeout, bus healthy
    Error     // bus-level failure; handle should be released
};

/**
 * CanBus - one CAN channel.
 *
 * SocketCanIface is the production implementation; tests drive
 * BusListener and the OBD-II client through scripted fakes.
 */
class CanBus {
public:
    virtual ~CanBus() = default;

    virtual bool open(const std::string& channel) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual RxStatus receive(RawFrame& out, int timeout_ms) = 0;

    // Receive-only buses (the signal listener) keep the default
    virtual bool send(const RawFrame& frame) {
        (void)frame;
        return false;
    }

    // Kernel-side id/mask filter; false means the caller filters in software
    virtual bool set_mask_filter(uint32_t id, uint32_t mask) {
        (void)id;
        (void)mask;
        return false;
    }
};

// Produces a fresh, unopened bus for every connection attempt
using BusFactory = std::function<std::unique_ptr<CanBus>()>;

} // namespace can
