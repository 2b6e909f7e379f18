// src/gps/nmea_position_source.cpp
#include "gps/nmea_position_source.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"

#include <stdexcept>

namespace gps {

NmeaPositionSource::NmeaPositionSource(Config config, std::unique_ptr<serial::Stream> stream,
                                       ClockFn mono_clock)
    : config_(std::move(config))
    , stream_(std::move(stream))
    , clock_(mono_clock ? std::move(mono_clock) : ClockFn(utils::monotonic_seconds))
{
    if (!(config_.stale_after_s > 0.0)) {
        throw std::invalid_argument("NmeaPositionSource stale_after_s must be positive");
    }
}

NmeaPositionSource::~NmeaPositionSource() {
    close();
}

bool NmeaPositionSource::start() {
    if (worker_.running()) {
        return true;
    }
    if (!stream_ || !stream_->is_open()) {
        LOG_ERROR("[GPS] %s is not open, position source disabled", config_.device.c_str());
        return false;
    }

    stop_.clear();
    reading_ = true;
    worker_.start("gps-reader", [this]() { run(); });
    LOG_INFO("[GPS] Reading NMEA from %s", config_.device.c_str());
    return true;
}

void NmeaPositionSource::run() {
    char buf[256];
    while (!stop_.is_set()) {
        const long n = stream_->read_some(buf, sizeof(buf), kReadTimeoutMs);
        if (n < 0) {
            LOG_ERROR("[GPS] Receiver on %s stopped responding", config_.device.c_str());
            break;
        }
        if (n > 0) {
            consume(buf, static_cast<size_t>(n));
        }
    }
    reading_ = false;
}

void NmeaPositionSource::consume(const char* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < len; ++i) {
        const char c = data[i];
        if (c == '\n') {
            if (partial_.empty() || partial_ == "\r") {
                partial_.clear();
                continue;
            }
            if (tracker_.feed(partial_)) {
                last_fix_at_ = clock_();
            } else if (!tracker_.has_fix()) {
                last_fix_at_.reset();
            }
            partial_.clear();
        } else if (partial_.size() < kMaxLineLength) {
            partial_.push_back(c);
        }
    }
}

std::optional<telemetry::GpsFix> NmeaPositionSource::get_position() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fix = tracker_.fix();
    if (!fix || !last_fix_at_) {
        return std::nullopt;
    }
    const double age = clock_() - *last_fix_at_;
    if (age > config_.stale_after_s) {
        LOG_DEBUG("[GPS] Last fix is %.1f s old, ignoring", age);
        return std::nullopt;
    }
    return fix;
}

void NmeaPositionSource::close() {
    stop_.set();
    if (worker_.joinable()) {
        const double grace = kReadTimeoutMs / 1000.0 + 1.0;
        if (!worker_.join_for(grace)) {
            LOG_WARN("[GPS] Reader thread did not stop within %.1f s", grace);
            return;
        }
    }
    reading_ = false;
    if (stream_ && stream_->is_open()) {
        stream_->close();
        LOG_INFO("[GPS] Closed %s", config_.device.c_str());
    }
}

size_t NmeaPositionSource::sentences_parsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.sentences_parsed();
}

size_t NmeaPositionSource::sentences_rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.sentences_rejected();
}

} // namespace gps
