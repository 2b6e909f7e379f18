#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>

namespace utils
{

    /**
     * Worker - a named thread that can be joined with a deadline.
     *
     * std::thread::join() has no timeout. The body reports completion
     * through a promise; join_for() waits on the matching future and only
     * joins once the body has returned. A worker still running after the
     * deadline stays joinable; the destructor joins it.
     */
    class Worker
    {
    public:
        Worker() = default;

        ~Worker()
        {
            if (thread_.joinable())
                thread_.join();
        }

        Worker(const Worker &) = delete;
        Worker &operator=(const Worker &) = delete;

        // Caller checks running() first; a finished previous thread is reaped here
        void start(const std::string &name, std::function<void()> body)
        {
            if (thread_.joinable())
                thread_.join();
            name_ = name;
            std::promise<void> done;
            done_ = done.get_future();
            thread_ = std::thread([body = std::move(body), done = std::move(done)]() mutable {
                body();
                done.set_value();
            });
        }

        bool running() const
        {
            return done_.valid() &&
                   done_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        }

        bool joinable() const { return thread_.joinable(); }

        // True if the thread finished and was joined within the timeout
        bool join_for(double seconds)
        {
            if (!thread_.joinable())
                return true;
            auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(seconds));
            if (done_.wait_for(timeout) != std::future_status::ready)
                return false;
            thread_.join();
            return true;
        }

        const std::string &name() const { return name_; }

    private:
        std::string name_;
        std::thread thread_;
        std::future<void> done_;
    };

} // namespace utils
