#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace utils
{

    /**
     * StopSignal - shared cancellation flag with an interruptible timed wait.
     *
     * Every sleep in the worker loops goes through wait_for() so that a
     * stop request wakes the sleeper immediately instead of after the
     * full interval.
     */
    class StopSignal
    {
    public:
        void set()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopped_ = true;
            }
            cv_.notify_all();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = false;
        }

        bool is_set() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return stopped_;
        }

        // Returns true if the signal was set before the timeout expired
        bool wait_for(double seconds)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (seconds <= 0.0)
                return stopped_;
            auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(seconds));
            return cv_.wait_for(lock, timeout, [this] { return stopped_; });
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool stopped_ = false;
    };

} // namespace utils
