// src/serial/serial_port.hpp
#pragma once

#include <cstddef>
#include <string>

namespace serial {

/**
 * Stream - byte stream to a serial device.
 *
 * SerialPort is the production implementation; the GPS reader and the mesh
 * sink are tested against in-memory fakes.
 */
class Stream {
public:
    virtual ~Stream() = default;

    virtual bool is_open() const = 0;

    // Bytes read, 0 when nothing arrived within timeout_ms, -1 when the device failed
    virtual long read_some(char* buf, size_t len, int timeout_ms) = 0;

    // Blocks until everything is written or the device fails
    virtual bool write_all(const std::string& data) = 0;

    virtual void close() = 0;
};

bool is_supported_baudrate(int baudrate);

// Raw 8N1 tty, no flow control, non-canonical
class SerialPort : public Stream {
public:
    SerialPort() = default;
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool open(const std::string& device, int baudrate);
    void close() override;

    bool is_open() const override { return fd_ >= 0; }

    long read_some(char* buf, size_t len, int timeout_ms) override;
    bool write_all(const std::string& data) override;

    const std::string& device() const { return device_; }

private:
    int fd_ = -1;
    std::string device_;
};

} // namespace serial
