// src/can/bus_listener.cpp
#include "can/bus_listener.hpp"
#include "can/frame_decoder.hpp"
#include "utils/logging.hpp"

#include <stdexcept>

namespace can {

const char* to_string(BusState state) {
    switch (state) {
        case BusState::Disconnected: return "Disconnected";
        case BusState::Connecting:   return "Connecting";
        case BusState::Connected:    return "Connected";
        case BusState::Reconnecting: return "Reconnecting";
        case BusState::Terminated:   return "Terminated";
    }
    return "Unknown";
}

BusListener::BusListener(BusListenerConfig config,
                         BusFactory factory,
                         SignalCatalog catalog,
                         std::shared_ptr<SampleQueue> queue,
                         std::shared_ptr<utils::StopSignal> stop)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , catalog_(std::move(catalog))
    , queue_(std::move(queue))
    , stop_(std::move(stop))
{
    if (!factory_ || !queue_ || !stop_) {
        throw std::invalid_argument("BusListener requires a bus factory, a queue and a stop signal");
    }
    if (config_.connection_retries < 0) {
        config_.connection_retries = 0;
    }
}

BusListener::~BusListener() {
    close();
}

bool BusListener::connect() {
    if (state_.load() != BusState::Reconnecting) {
        state_ = BusState::Connecting;
    }
    release_bus();

    const int attempts = config_.connection_retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        LOG_INFO("[CAN] Connecting to %s (attempt %d/%d)",
                 config_.channel.c_str(), attempt, attempts);

        try {
            std::unique_ptr<CanBus> bus = factory_();
            if (bus && bus->open(config_.channel)) {
                std::lock_guard<std::mutex> lock(bus_mutex_);
                bus_ = std::move(bus);
                state_ = BusState::Connected;
                LOG_INFO("[CAN] Connected to %s", config_.channel.c_str());
                return true;
            }
            LOG_ERROR("[CAN] Could not open %s (attempt %d)", config_.channel.c_str(), attempt);
        } catch (const std::exception& e) {
            LOG_ERROR("[CAN] Unexpected error opening %s (attempt %d): %s",
                      config_.channel.c_str(), attempt, e.what());
        }

        if (attempt < attempts) {
            LOG_INFO("[CAN] Retrying in %.1f s", config_.retry_delay_s);
            if (stop_->wait_for(config_.retry_delay_s)) {
                LOG_INFO("[CAN] Connection retry aborted by stop request");
                break;
            }
        }
    }

    state_ = BusState::Terminated;
    LOG_ERROR("[CAN] Failed to connect to %s", config_.channel.c_str());
    return false;
}

bool BusListener::start() {
    if (worker_.running()) {
        LOG_WARN("[CAN] Listener thread already running");
        return true;
    }
    if (!is_connected()) {
        LOG_WARN("[CAN] Not connected (state %s), listener not started", to_string(state()));
        return false;
    }
    worker_.start("can-listener", [this]() { run(); });
    LOG_INFO("[CAN] Listener thread started");
    return true;
}

RxStatus BusListener::receive_once(RawFrame& frame) {
    const int timeout_ms = static_cast<int>(config_.receive_timeout_s * 1000.0);
    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (!bus_ || !bus_->is_open()) {
        return RxStatus::Error;
    }
    return bus_->receive(frame, timeout_ms);
}

void BusListener::handle_frame(const RawFrame& frame) {
    ++frames_received_;
    auto samples = FrameDecoder::decode(frame, catalog_);
    for (auto& sample : samples) {
        const std::string name = sample.name;
        if (!queue_->try_push(std::move(sample))) {
            ++samples_dropped_;
            LOG_WARN("[CAN] Sample queue full (%zu), dropping '%s'",
                     queue_->capacity(), name.c_str());
        }
    }
}

void BusListener::run() {
    LOG_INFO("[CAN] Receive loop running on %s", config_.channel.c_str());

    while (!stop_->is_set() && is_connected()) {
        try {
            RawFrame frame;
            const RxStatus status = receive_once(frame);

            if (status == RxStatus::Timeout) {
                continue;
            }

            if (status == RxStatus::Error) {
                LOG_ERROR("[CAN] Bus error on %s, reconnecting", config_.channel.c_str());
                state_ = BusState::Reconnecting;
                release_bus();
                if (stop_->is_set()) {
                    break;
                }
                if (!connect()) {
                    if (!stop_->is_set()) {
                        LOG_FATAL("[CAN] Reconnect to %s failed, listener terminated",
                                  config_.channel.c_str());
                    }
                    break;
                }
                continue;
            }

            handle_frame(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("[CAN] Unexpected error in receive loop: %s", e.what());
            if (stop_->wait_for(1.0)) {
                break;
            }
        }
    }

    LOG_INFO("[CAN] Receive loop stopped (state %s, %llu frames, %llu dropped)",
             to_string(state()),
             static_cast<unsigned long long>(frames_received_.load()),
             static_cast<unsigned long long>(samples_dropped_.load()));
}

void BusListener::stop() {
    stop_->set();
    if (!worker_.joinable()) {
        return;
    }
    const double grace = config_.receive_timeout_s + 1.0;
    if (!worker_.join_for(grace)) {
        LOG_WARN("[CAN] Listener thread did not stop within %.1f s", grace);
    }
}

void BusListener::release_bus() {
    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (bus_) {
        try {
            bus_->close();
        } catch (const std::exception& e) {
            LOG_WARN("[CAN] Error closing %s: %s", config_.channel.c_str(), e.what());
        }
        bus_.reset();
    }
}

void BusListener::close() {
    stop();
    release_bus();
    BusState expected = BusState::Connected;
    state_.compare_exchange_strong(expected, BusState::Disconnected);
}

} // namespace can
