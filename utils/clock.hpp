#pragma once
#include <chrono>

namespace utils
{

    // Seconds on the steady clock; immune to wall-clock adjustment.
    inline double monotonic_seconds()
    {
        auto now = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    // Seconds since the Unix epoch.
    inline double wall_seconds()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

} // namespace utils
