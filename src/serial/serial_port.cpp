// src/serial/serial_port.cpp
#include "serial/serial_port.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace serial {

namespace {

constexpr int kWriteTimeoutMs = 1000;

bool to_speed(int baudrate, speed_t& out) {
    switch (baudrate) {
        case 4800:   out = B4800;   return true;
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        default:     return false;
    }
}

} // namespace

bool is_supported_baudrate(int baudrate) {
    speed_t unused;
    return to_speed(baudrate, unused);
}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::open(const std::string& device, int baudrate) {
    close();

    speed_t speed;
    if (!to_speed(baudrate, speed)) {
        LOG_ERROR("[Serial] Unsupported baud rate %d for %s", baudrate, device.c_str());
        return false;
    }

    fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        LOG_ERROR("[Serial] open(%s) failed: %s", device.c_str(), std::strerror(errno));
        return false;
    }

    struct termios tio{};
    if (::tcgetattr(fd_, &tio) < 0) {
        LOG_ERROR("[Serial] tcgetattr(%s) failed: %s", device.c_str(), std::strerror(errno));
        close();
        return false;
    }

    ::cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | CRTSCTS);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) < 0) {
        LOG_ERROR("[Serial] tcsetattr(%s) failed: %s", device.c_str(), std::strerror(errno));
        close();
        return false;
    }
    ::tcflush(fd_, TCIOFLUSH);

    device_ = device;
    LOG_INFO("[Serial] Opened %s at %d baud", device.c_str(), baudrate);
    return true;
}

void SerialPort::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

long SerialPort::read_some(char* buf, size_t len, int timeout_ms) {
    if (fd_ < 0) {
        return -1;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) {
            return 0;
        }
        LOG_ERROR("[Serial] poll() failed on %s: %s", device_.c_str(), std::strerror(errno));
        return -1;
    }
    if (ret == 0) {
        return 0;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        LOG_ERROR("[Serial] %s reported poll events 0x%x", device_.c_str(), pfd.revents);
        return -1;
    }

    ssize_t n = ::read(fd_, buf, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return 0;
        }
        LOG_ERROR("[Serial] read() failed on %s: %s", device_.c_str(), std::strerror(errno));
        return -1;
    }
    if (n == 0) {
        // USB adapter unplugged
        LOG_ERROR("[Serial] %s closed by the device", device_.c_str());
        return -1;
    }
    return static_cast<long>(n);
}

bool SerialPort::write_all(const std::string& data) {
    if (fd_ < 0) {
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_ERROR("[Serial] write() failed on %s: %s", device_.c_str(), std::strerror(errno));
            return false;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, kWriteTimeoutMs);
        if (ret == 0) {
            LOG_ERROR("[Serial] write to %s timed out", device_.c_str());
            return false;
        }
        if (ret < 0 && errno != EINTR) {
            LOG_ERROR("[Serial] poll() failed on %s: %s", device_.c_str(), std::strerror(errno));
            return false;
        }
    }
    return true;
}

} // namespace serial
