// src/can/bus_listener.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "can/can_bus.hpp"
#include "can/frame.hpp"
#include "can/signal_catalog.hpp"
#include "utils/bounded_queue.hpp"
#include "utils/stop_signal.hpp"
#include "utils/worker.hpp"

namespace can {

using SampleQueue = utils::BoundedQueue<DecodedSample>;

enum class BusState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Terminated
};

const char* to_string(BusState state);

struct BusListenerConfig {
    std::string channel = "can0";
    int connection_retries = 3;         // open attempts = retries + 1
    double retry_delay_s = 5.0;
    double receive_timeout_s = 1.0;
};

/**
 * BusListener - owns the CAN connection and the receive thread.
 *
 * Lifecycle:
 *   Disconnected -> Connecting -> Connected -> (bus error) -> Reconnecting
 *                                    ^                              |
 *                                    +---------- ok ---------------+-- fail --> Terminated
 *
 * Startup gets connection_retries + 1 attempts. At runtime a bus error gets
 * exactly one reconnect cycle; if that fails the listener terminates and the
 * rest of the pipeline keeps running without bus data.
 *
 * Decoded samples go to the shared queue with try_push(); a full queue drops
 * the new sample. All waits are on the shared StopSignal.
 */
class BusListener {
public:
    BusListener(BusListenerConfig config,
                BusFactory factory,
                SignalCatalog catalog,
                std::shared_ptr<SampleQueue> queue,
                std::shared_ptr<utils::StopSignal> stop);
    ~BusListener();

    BusListener(const BusListener&) = delete;
    BusListener& operator=(const BusListener&) = delete;

    /**
     * Open the bus, retrying with retry_delay_s between attempts.
     * A stop request abandons the remaining attempts.
     * @return true if Connected; false leaves the listener Terminated
     */
    bool connect();

    // Spawn the receive thread. False if not connected.
    bool start();

    // Receive loop; runs on the listener thread (callable directly in tests)
    void run();

    // Set the stop signal and join the receive thread (receive_timeout + 1 s)
    void stop();

    // stop() and release the bus. Idempotent.
    void close();

    BusState state() const { return state_.load(); }
    bool is_connected() const { return state_.load() == BusState::Connected; }
    bool is_running() const { return worker_.running(); }

    const SignalCatalog& catalog() const { return catalog_; }
    const BusListenerConfig& config() const { return config_; }

    uint64_t frames_received() const { return frames_received_.load(); }
    uint64_t samples_dropped() const { return samples_dropped_.load(); }

private:
    RxStatus receive_once(RawFrame& frame);
    void handle_frame(const RawFrame& frame);
    void release_bus();

    BusListenerConfig config_;
    BusFactory factory_;
    const SignalCatalog catalog_;
    std::shared_ptr<SampleQueue> queue_;
    std::shared_ptr<utils::StopSignal> stop_;

    std::mutex bus_mutex_;
    std::unique_ptr<CanBus> bus_;
    std::atomic<BusState> state_{BusState::Disconnected};

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> samples_dropped_{0};

    utils::Worker worker_;
};

} // namespace can
