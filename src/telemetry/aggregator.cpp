// src/telemetry/aggregator.cpp
#include "telemetry/aggregator.hpp"
#include "telemetry/device_id.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace telemetry {

Aggregator::Aggregator(AggregatorConfig config,
                       Collaborators collaborators,
                       std::shared_ptr<can::SampleQueue> queue,
                       std::shared_ptr<utils::StopSignal> stop,
                       std::string device_id,
                       ClockFn wall_clock,
                       ClockFn mono_clock)
    : config_(std::move(config))
    , sinks_(std::move(collaborators))
    , queue_(std::move(queue))
    , stop_(std::move(stop))
    , device_id_(std::move(device_id))
    , wall_clock_(wall_clock ? std::move(wall_clock) : ClockFn(utils::wall_seconds))
    , pacer_(config_.data_interval_s, mono_clock)
{
    if (!stop_) {
        throw std::invalid_argument("Aggregator requires a stop signal");
    }
    if (!(config_.data_interval_s > 0.0)) {
        throw std::invalid_argument("Aggregator data interval must be positive");
    }
    if (sinks_.tracking) {
        tracking_limiter_.emplace(config_.tracking_report_interval_s,
                                  mono_clock ? mono_clock : ClockFn(utils::monotonic_seconds));
    }
    if (device_id_.empty() || is_fallback_id(device_id_)) {
        LOG_WARN("[Aggregator] Device id '%s' is not a stable identity; sinks may reject data",
                 device_id_.c_str());
    }
}

void Aggregator::collect_position(Snapshot& snap) {
    if (!sinks_.position) {
        return;
    }
    try {
        if (!sinks_.position->is_connected()) {
            LOG_DEBUG("[Aggregator] Position source not connected");
            return;
        }
        auto fix = sinks_.position->get_position();
        if (fix && !fix->empty()) {
            snap.gps = *fix;
        } else {
            LOG_DEBUG("[Aggregator] No position this cycle");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Aggregator] Position source failed: %s", e.what());
    } catch (...) {
        LOG_ERROR("[Aggregator] Position source failed: unknown exception");
    }
}

void Aggregator::collect_diagnostics(Snapshot& snap) {
    if (!sinks_.diagnostic) {
        return;
    }
    try {
        if (!sinks_.diagnostic->is_connected()) {
            LOG_WARN("[Aggregator] Diagnostic source not connected");
            return;
        }
        DiagnosticReading reading = sinks_.diagnostic->read();
        snap.sensors = std::move(reading.sensors);
        snap.dtcs = std::move(reading.dtcs);
    } catch (const std::exception& e) {
        LOG_ERROR("[Aggregator] Diagnostic source failed: %s", e.what());
    } catch (...) {
        LOG_ERROR("[Aggregator] Diagnostic source failed: unknown exception");
    }
}

size_t Aggregator::drain_samples(Snapshot& snap) {
    if (!queue_) {
        return 0;
    }
    size_t drained = 0;
    while (auto sample = queue_->try_pop()) {
        snap.bus_signals[sample->name] = sample->value;
        ++drained;
    }
    if (drained > 0) {
        LOG_DEBUG("[Aggregator] Drained %zu bus samples (%zu signals)",
                  drained, snap.bus_signals.size());
    }
    return drained;
}

void Aggregator::dispatch(const Snapshot& snap, CycleReport& report) {
    if (sinks_.mesh) {
        try {
            if (sinks_.mesh->is_connected()) {
                report.mesh_sent = sinks_.mesh->send(snap);
                if (report.mesh_sent) {
                    LOG_INFO("[Aggregator] Snapshot sent via mesh");
                } else {
                    LOG_WARN("[Aggregator] Mesh send failed");
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[Aggregator] Mesh sink error: %s", e.what());
        } catch (...) {
            LOG_ERROR("[Aggregator] Mesh sink error: unknown exception");
        }
    }

    if (sinks_.message_bus) {
        try {
            report.message_bus_sent = sinks_.message_bus->publish(snap, config_.message_bus_sub_topic);
            if (report.message_bus_sent) {
                LOG_INFO("[Aggregator] Snapshot published to message bus");
            } else {
                LOG_WARN("[Aggregator] Message bus publish failed");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[Aggregator] Message bus sink error: %s", e.what());
        } catch (...) {
            LOG_ERROR("[Aggregator] Message bus sink error: unknown exception");
        }
    }

    if (sinks_.tracking && tracking_limiter_) {
        try {
            if (!sinks_.tracking->is_configured()) {
                LOG_DEBUG("[Aggregator] Tracking sink not configured");
            } else if (!snap.gps || !snap.gps->has_valid_position()) {
                LOG_DEBUG("[Aggregator] Skipping tracking: no valid position");
            } else if (!tracking_limiter_->try_trigger()) {
                report.tracking_throttled = true;
                LOG_DEBUG("[Aggregator] Tracking rate limited, next in %.1f s",
                          tracking_limiter_->time_to_next_trigger());
            } else {
                report.tracking_sent = sinks_.tracking->send(snap);
                if (report.tracking_sent) {
                    LOG_INFO("[Aggregator] Position sent to tracking server");
                } else {
                    LOG_WARN("[Aggregator] Tracking send failed");
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[Aggregator] Tracking sink error: %s", e.what());
        } catch (...) {
            LOG_ERROR("[Aggregator] Tracking sink error: unknown exception");
        }
    }
}

CycleReport Aggregator::run_cycle() {
    CycleReport report;

    Snapshot snap;
    snap.timestamp_utc = std::max(wall_clock_(), last_timestamp_);
    snap.device_id = device_id_;

    collect_position(snap);
    collect_diagnostics(snap);
    report.samples_drained = drain_samples(snap);

    if (snap.empty()) {
        LOG_DEBUG("[Aggregator] Nothing collected this cycle");
        return report;
    }

    last_timestamp_ = snap.timestamp_utc;
    report.snapshot_built = true;
    dispatch(snap, report);
    report.snapshot = std::move(snap);
    return report;
}

void Aggregator::run() {
    LOG_INFO("[Aggregator] Data loop started (interval %.1f s)", config_.data_interval_s);

    const double error_backoff_s = std::min(kErrorBackoffS, 0.5 * config_.data_interval_s);

    while (!stop_->is_set()) {
        pacer_.mark_cycle_start();
        try {
            run_cycle();
        } catch (const std::exception& e) {
            ++cycle_errors_;
            LOG_ERROR("[Aggregator] Cycle failed: %s", e.what());
            if (stop_->wait_for(error_backoff_s)) {
                break;
            }
            continue;
        } catch (...) {
            ++cycle_errors_;
            LOG_ERROR("[Aggregator] Cycle failed: unknown exception");
            if (stop_->wait_for(error_backoff_s)) {
                break;
            }
            continue;
        }
        pacer_.update_stats();

        if (stop_->wait_for(pacer_.sleep_time())) {
            break;
        }
    }

    const auto& stats = pacer_.get_stats();
    LOG_INFO("[Aggregator] Data loop stopped (%zu cycles, %zu overruns, max %.3f s)",
             stats.total_cycles, stats.overruns, stats.max_cycle_time_s);
}

} // namespace telemetry
