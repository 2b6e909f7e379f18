#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace utils
{

    /**
     * BoundedQueue - fixed-capacity multi-thread FIFO.
     *
     * try_push() never blocks: when the queue is full the new element is
     * rejected and the caller decides what to log. try_pop() never blocks
     * either; the consumer drains on its own schedule.
     */
    template <typename T>
    class BoundedQueue
    {
    public:
        explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        BoundedQueue(const BoundedQueue &) = delete;
        BoundedQueue &operator=(const BoundedQueue &) = delete;

        bool try_push(T item)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_)
                return false;
            items_.push_back(std::move(item));
            return true;
        }

        std::optional<T> try_pop()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty())
                return std::nullopt;
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        bool empty() const { return size() == 0; }

        size_t capacity() const { return capacity_; }

    private:
        const size_t capacity_;
        mutable std::mutex mutex_;
        std::deque<T> items_;
    };

} // namespace utils
