// src/can/socketcan_iface.cpp
#include "can/socketcan_iface.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"

#include <cstdio>
#include <cstring>
#include <cerrno>

#include <poll.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace can {

SocketCanIface::~SocketCanIface() {
    close();
}

bool SocketCanIface::open(const std::string& ifname) {
    close();

    sock_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (sock_ < 0) {
        LOG_ERROR("[CAN] socket() failed: %s", std::strerror(errno));
        return false;
    }

    struct ifreq ifr{};
    std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", ifname.c_str());
    if (::ioctl(sock_, SIOCGIFINDEX, &ifr) < 0) {
        LOG_ERROR("[CAN] ioctl(SIOCGIFINDEX) failed for %s: %s",
                  ifname.c_str(), std::strerror(errno));
        close();
        return false;
    }

    struct sockaddr_can addr{};
    addr.can_family  = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;

    if (::bind(sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("[CAN] bind() failed on %s: %s", ifname.c_str(), std::strerror(errno));
        close();
        return false;
    }

    ifname_ = ifname;
    return true;
}

void SocketCanIface::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

RxStatus SocketCanIface::receive(RawFrame& out, int timeout_ms) {
    if (sock_ < 0) {
        return RxStatus::Error;
    }

    struct pollfd pfd;
    pfd.fd = sock_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) {
            return RxStatus::Timeout;
        }
        LOG_ERROR("[CAN] poll() failed: %s", std::strerror(errno));
        return RxStatus::Error;
    }

    if (ret == 0) {
        return RxStatus::Timeout;
    }

    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        LOG_ERROR("[CAN] %s reported poll events 0x%x", ifname_.c_str(), pfd.revents);
        return RxStatus::Error;
    }

    if (!(pfd.revents & POLLIN)) {
        return RxStatus::Timeout;
    }

    struct can_frame frame{};
    ssize_t nbytes = ::read(sock_, &frame, sizeof(struct can_frame));
    if (nbytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return RxStatus::Timeout;
        }
        LOG_ERROR("[CAN] read() failed: %s", std::strerror(errno));
        return RxStatus::Error;
    }

    if (nbytes < static_cast<ssize_t>(sizeof(struct can_frame))) {
        LOG_ERROR("[CAN] Incomplete CAN frame read: %zd bytes (expected %zu)",
                  nbytes, sizeof(struct can_frame));
        return RxStatus::Error;
    }

    if (frame.can_id & (CAN_RTR_FLAG | CAN_ERR_FLAG)) {
        return RxStatus::Timeout;
    }

    out.arbitration_id = (frame.can_id & CAN_EFF_FLAG) ? (frame.can_id & CAN_EFF_MASK)
                                                       : (frame.can_id & CAN_SFF_MASK);
    out.size = frame.can_dlc > 8 ? 8 : frame.can_dlc;
    out.data.fill(0);
    std::memcpy(out.data.data(), frame.data, out.size);
    out.timestamp = utils::wall_seconds();
    return RxStatus::Frame;
}

bool SocketCanIface::send(const RawFrame& frame) {
    if (sock_ < 0) return false;

    struct can_frame out{};
    if (frame.arbitration_id > CAN_SFF_MASK) {
        out.can_id = (frame.arbitration_id & CAN_EFF_MASK) | CAN_EFF_FLAG;
    } else {
        out.can_id = frame.arbitration_id;
    }
    out.can_dlc = frame.size > 8 ? 8 : frame.size;
    std::memcpy(out.data, frame.data.data(), out.can_dlc);

    const ssize_t n = ::write(sock_, &out, sizeof(out));
    if (n < 0) {
        LOG_ERROR("[CAN] write() failed on %s: %s", ifname_.c_str(), std::strerror(errno));
        return false;
    }
    return n == static_cast<ssize_t>(sizeof(out));
}

bool SocketCanIface::set_filters(const std::vector<uint32_t>& ids_11bit) {
    if (sock_ < 0) return false;

    if (ids_11bit.empty()) {
        // Clear filters => receive everything
        return ::setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_FILTER, nullptr, 0) == 0;
    }

    std::vector<struct can_filter> filters;
    filters.reserve(ids_11bit.size());
    for (uint32_t id : ids_11bit) {
        struct can_filter f{};
        f.can_id   = id & CAN_SFF_MASK;
        f.can_mask = CAN_SFF_MASK;
        filters.push_back(f);
    }

    if (::setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_FILTER,
                     filters.data(),
                     static_cast<socklen_t>(filters.size() * sizeof(struct can_filter))) < 0) {
        LOG_ERROR("[CAN] setsockopt(CAN_RAW_FILTER) failed: %s", std::strerror(errno));
        return false;
    }

    return true;
}

bool SocketCanIface::set_mask_filter(uint32_t id, uint32_t mask) {
    if (sock_ < 0) return false;

    struct can_filter f{};
    f.can_id   = id & CAN_SFF_MASK;
    f.can_mask = (mask & CAN_SFF_MASK) | CAN_EFF_FLAG | CAN_RTR_FLAG;

    if (::setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_FILTER, &f, sizeof(f)) < 0) {
        LOG_ERROR("[CAN] setsockopt(CAN_RAW_FILTER) failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace can
