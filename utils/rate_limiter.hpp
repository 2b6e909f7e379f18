#pragma once
#include <functional>
#include <optional>

namespace utils
{

    /**
     * RateLimiter - interval gate for actions that must not run faster than
     * a configured period.
     *
     * Usage:
     *   RateLimiter limiter(30.0);
     *   if (limiter.try_trigger()) { send(); }
     *   else { LOG_DEBUG("next in %.1fs", limiter.time_to_next_trigger()); }
     *
     * The first try_trigger() always succeeds. Not thread-safe; each sink
     * owns its own limiter.
     */
    class RateLimiter
    {
    public:
        // Returns monotonic seconds. Tests inject a manual clock.
        using ClockFn = std::function<double()>;

        /**
         * @param interval_s Minimum spacing between triggers (seconds)
         * @throws std::invalid_argument if interval_s <= 0
         */
        explicit RateLimiter(double interval_s, ClockFn clock = ClockFn());

        // True (and records now) iff at least interval_s elapsed since the last trigger
        bool try_trigger();

        // Next try_trigger() succeeds regardless of elapsed time
        void reset();

        // +infinity if never triggered
        double time_since_last_trigger() const;

        // Seconds until try_trigger() would succeed, >= 0
        double time_to_next_trigger() const;

        double interval() const { return interval_s_; }

    private:
        double interval_s_;
        ClockFn clock_;
        std::optional<double> last_trigger_;
    };

} // namespace utils
