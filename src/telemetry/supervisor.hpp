// src/telemetry/supervisor.hpp
#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

#include "can/bus_listener.hpp"
#include "telemetry/aggregator.hpp"
#include "telemetry/collaborators.hpp"
#include "utils/stop_signal.hpp"
#include "utils/worker.hpp"

namespace telemetry {

/**
 * Supervisor - owns the pipeline threads and the shutdown order.
 *
 * start(): clear stop signal -> connect/start bus listener -> start aggregator
 * stop():  set stop signal -> stop bus listener -> join aggregator
 *          (data_interval + 5 s) -> close tracking, message bus, mesh,
 *          diagnostic, position -> close bus
 *
 * stop() is terminal and idempotent; every collaborator is closed once.
 * The bus connect runs outside the lock, so a stop() from another thread
 * during the startup retries aborts them and start() returns false.
 */
class Supervisor {
public:
    static constexpr double kAggregatorJoinGraceS = 5.0;

    /**
     * @param listener  may be null when the bus is disabled
     */
    Supervisor(std::shared_ptr<utils::StopSignal> stop,
               std::shared_ptr<can::BusListener> listener,
               std::shared_ptr<Aggregator> aggregator,
               Collaborators collaborators);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    bool start();
    void stop();

    bool is_running() const;
    bool is_stopped() const;

private:
    void close_collaborators();

    std::shared_ptr<utils::StopSignal> stop_;
    std::shared_ptr<can::BusListener> listener_;
    std::shared_ptr<Aggregator> aggregator_;
    Collaborators collaborators_;

    mutable std::mutex mutex_;
    std::condition_variable start_done_;
    bool starting_ = false;
    bool stopped_ = false;
    utils::Worker aggregator_worker_;
};

} // namespace telemetry
