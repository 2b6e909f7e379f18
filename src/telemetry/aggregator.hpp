// src/telemetry/aggregator.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "can/bus_listener.hpp"
#include "telemetry/collaborators.hpp"
#include "telemetry/cycle_pacer.hpp"
#include "telemetry/snapshot.hpp"
#include "utils/rate_limiter.hpp"
#include "utils/stop_signal.hpp"

namespace telemetry {

struct AggregatorConfig {
    double data_interval_s = 10.0;
    double tracking_report_interval_s = 30.0;
    std::string message_bus_sub_topic = "sensors";
};

// Outcome of one run_cycle()
struct CycleReport {
    bool snapshot_built = false;
    size_t samples_drained = 0;

    bool mesh_sent = false;
    bool message_bus_sent = false;
    bool tracking_sent = false;
    bool tracking_throttled = false;

    std::optional<Snapshot> snapshot;
};

/**
 * Aggregator - periodic merge of bus samples and pulled readings into one
 * Snapshot, then fan-out to the sinks.
 *
 * Each cycle:
 *   1. pull position and diagnostics (only from connected sources)
 *   2. drain the sample queue, last value per signal name wins
 *   3. discard an empty snapshot
 *   4. dispatch to mesh, message bus and tracking sinks independently
 *
 * Collaborator and sink exceptions are logged per call and never abort the
 * cycle. Tracking is additionally gated on a valid fix and its RateLimiter.
 */
class Aggregator {
public:
    using ClockFn = std::function<double()>;

    // Upper bound on the wait after a failed cycle
    static constexpr double kErrorBackoffS = 5.0;

    /**
     * @param queue       may be null when the bus is disabled
     * @param wall_clock  unix seconds for snapshot timestamps
     * @param mono_clock  steady seconds for pacing and rate limiting
     */
    Aggregator(AggregatorConfig config,
               Collaborators collaborators,
               std::shared_ptr<can::SampleQueue> queue,
               std::shared_ptr<utils::StopSignal> stop,
               std::string device_id,
               ClockFn wall_clock = ClockFn(),
               ClockFn mono_clock = ClockFn());

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    // One synchronous cycle
    CycleReport run_cycle();

    // Loop until the stop signal is set; runs on the aggregator thread
    void run();

    const std::string& device_id() const { return device_id_; }
    const AggregatorConfig& config() const { return config_; }
    const CyclePacer::Stats& pacing_stats() const { return pacer_.get_stats(); }
    size_t cycle_errors() const { return cycle_errors_; }

private:
    void collect_position(Snapshot& snap);
    void collect_diagnostics(Snapshot& snap);
    size_t drain_samples(Snapshot& snap);
    void dispatch(const Snapshot& snap, CycleReport& report);

    AggregatorConfig config_;
    Collaborators sinks_;
    std::shared_ptr<can::SampleQueue> queue_;
    std::shared_ptr<utils::StopSignal> stop_;
    std::string device_id_;

    ClockFn wall_clock_;
    CyclePacer pacer_;
    std::optional<utils::RateLimiter> tracking_limiter_;

    double last_timestamp_ = 0.0;
    size_t cycle_errors_ = 0;
};

} // namespace telemetry
