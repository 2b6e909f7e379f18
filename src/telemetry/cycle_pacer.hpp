// src/telemetry/cycle_pacer.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>

#include "utils/clock.hpp"

namespace telemetry {

/**
 * CyclePacer - fixed-period pacing, loop start to loop start.
 *
 * The caller does the actual sleeping (on its stop signal) so the wait
 * stays interruptible:
 *
 *   pacer.mark_cycle_start();
 *   do_work();
 *   pacer.update_stats();
 *   if (stop.wait_for(pacer.sleep_time())) break;
 *
 * Never sleeps less than kMinSleepS, even after an overrun.
 */
class CyclePacer {
public:
    struct Stats {
        size_t total_cycles = 0;
        size_t overruns = 0;            // cycles longer than the period
        double max_cycle_time_s = 0.0;
        double avg_cycle_time_s = 0.0;
    };

    static constexpr double kMinSleepS = 0.1;

    using ClockFn = std::function<double()>;

    explicit CyclePacer(double period_s, ClockFn clock = ClockFn())
        : period_s_(period_s), clock_(std::move(clock))
    {
        if (!clock_) {
            clock_ = utils::monotonic_seconds;
        }
        cycle_start_ = clock_();
    }

    void mark_cycle_start() {
        cycle_start_ = clock_();
    }

    double elapsed() const {
        return clock_() - cycle_start_;
    }

    // max(kMinSleepS, period - elapsed)
    double sleep_time() const {
        return std::max(kMinSleepS, period_s_ - elapsed());
    }

    void update_stats() {
        const double t = elapsed();
        stats_.total_cycles++;
        if (t > period_s_) {
            stats_.overruns++;
        }
        stats_.max_cycle_time_s = std::max(stats_.max_cycle_time_s, t);
        total_cycle_time_s_ += t;
        stats_.avg_cycle_time_s = total_cycle_time_s_ / stats_.total_cycles;
    }

    double period() const { return period_s_; }
    const Stats& get_stats() const { return stats_; }

private:
    double period_s_;
    ClockFn clock_;
    double cycle_start_ = 0.0;
    double total_cycle_time_s_ = 0.0;
    Stats stats_;
};

} // namespace telemetry
