#include "rate_limiter.hpp"
#include "clock.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace utils
{

    RateLimiter::RateLimiter(double interval_s, ClockFn clock)
        : interval_s_(interval_s), clock_(std::move(clock))
    {
        if (!(interval_s_ > 0.0))
        {
            throw std::invalid_argument("RateLimiter interval must be positive, got " +
                                        std::to_string(interval_s));
        }
        if (!clock_)
        {
            clock_ = monotonic_seconds;
        }
    }

    bool RateLimiter::try_trigger()
    {
        const double now = clock_();
        if (last_trigger_ && (now - *last_trigger_) < interval_s_)
        {
            return false;
        }
        last_trigger_ = now;
        return true;
    }

    void RateLimiter::reset()
    {
        last_trigger_.reset();
    }

    double RateLimiter::time_since_last_trigger() const
    {
        if (!last_trigger_)
            return std::numeric_limits<double>::infinity();
        return clock_() - *last_trigger_;
    }

    double RateLimiter::time_to_next_trigger() const
    {
        if (!last_trigger_)
            return 0.0;
        return std::max(0.0, interval_s_ - time_since_last_trigger());
    }

} // namespace utils
