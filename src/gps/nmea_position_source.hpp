// src/gps/nmea_position_source.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "gps/nmea.hpp"
#include "serial/serial_port.hpp"
#include "telemetry/collaborators.hpp"
#include "utils/stop_signal.hpp"
#include "utils/worker.hpp"

namespace gps {

/**
 * NmeaPositionSource - position from a receiver streaming NMEA 0183.
 *
 * A reader thread consumes the serial stream and keeps the latest fix.
 * get_position() returns it unless it is older than stale_after_s, so a
 * receiver that loses the sky reports "no data" rather than an old fix.
 */
class NmeaPositionSource : public telemetry::PositionSource {
public:
    struct Config {
        std::string device = "/dev/ttyACM0";
        double stale_after_s = 5.0;
    };

    using ClockFn = std::function<double()>;

    static constexpr int kReadTimeoutMs = 200;
    static constexpr size_t kMaxLineLength = 164;   // NMEA limit is 82; be lenient

    /**
     * @param stream  opened by the caller; may be null or closed, in which
     *                case the source simply never connects
     */
    NmeaPositionSource(Config config, std::unique_ptr<serial::Stream> stream,
                       ClockFn mono_clock = ClockFn());
    ~NmeaPositionSource() override;

    NmeaPositionSource(const NmeaPositionSource&) = delete;
    NmeaPositionSource& operator=(const NmeaPositionSource&) = delete;

    // Spawn the reader thread. False if the stream is not open.
    bool start();

    bool is_connected() const override { return reading_.load(); }
    std::optional<telemetry::GpsFix> get_position() override;
    void close() override;

    // Feed raw bytes; the reader thread calls this for every chunk
    void consume(const char* data, size_t len);

    size_t sentences_parsed() const;
    size_t sentences_rejected() const;

private:
    void run();

    Config config_;
    std::unique_ptr<serial::Stream> stream_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    NmeaFixTracker tracker_;
    std::string partial_;
    std::optional<double> last_fix_at_;

    std::atomic<bool> reading_{false};
    utils::StopSignal stop_;
    utils::Worker worker_;
};

} // namespace gps
