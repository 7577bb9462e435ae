#ifndef XFER_UTILS_BLOCKINGQUEUE_HPP_
#define XFER_UTILS_BLOCKINGQUEUE_HPP_

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace xfer::utils
{
/**
 * Multi-producer FIFO queue.
 *
 * Elements are popped in the order in which they were pushed, across all producers. A capacity
 * of 0 means the queue is unbounded, otherwise push blocks while the queue is full.
 */
template<typename T>
class BlockingQueue
{
public:
    using ValueType = T;

    explicit BlockingQueue(size_t capacity = 0)
        : capacity_ {capacity}
    {}

    BlockingQueue(const BlockingQueue &) = delete;
    BlockingQueue &operator=(const BlockingQueue &) = delete;

    void push(T value)
    {
        {
            std::unique_lock<std::mutex> lock {mutex_};
            cv_not_full_.wait(lock, [this] { return capacity_ == 0 || queue_.size() < capacity_; });
            queue_.push(std::move(value));
        }
        cv_not_empty_.notify_one();
    }

    [[nodiscard]] T pop()
    {
        T value;

        {
            std::unique_lock<std::mutex> lock {mutex_};
            cv_not_empty_.wait(lock, [this] { return !queue_.empty(); });
            value = std::move(queue_.front());
            queue_.pop();
        }
        cv_not_full_.notify_one();

        return value;
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard<std::mutex> lock {mutex_};
        return queue_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return size() == 0;
    }

    [[nodiscard]] size_t capacity() const
    {
        return capacity_;
    }

private:
    const size_t            capacity_;
    std::queue<T>           queue_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_BLOCKINGQUEUE_HPP_
