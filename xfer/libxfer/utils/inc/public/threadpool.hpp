#ifndef XFER_UTILS_THREADPOOL_HPP_
#define XFER_UTILS_THREADPOOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "completiontoken.hpp"

namespace xfer::utils
{
/**
 * Fixed set of named worker threads taking jobs in FIFO order.
 *
 * An exception escaping a job is logged and the worker moves on to the next job. Jobs still
 * queued when the pool is destroyed are cancelled without running.
 */
class ThreadPool
{
public:
    using Job = std::function<void(const CompletionToken &)>;

    ThreadPool(std::string name, size_t thread_count);
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
    ~ThreadPool();

    CompletionToken add_job(Job &&job);

    // Blocks until every job added so far has run or was cancelled
    void wait_idle();

    [[nodiscard]] size_t             pending_jobs() const;
    [[nodiscard]] size_t             thread_count() const;
    [[nodiscard]] const std::string &name() const;

private:
    void worker_routine(size_t worker_index);
    void run_job(const Job &job, const CompletionToken &completion_token) const;

    const std::string                           name_;
    std::vector<std::thread>                    workers_;
    std::deque<std::pair<Job, CompletionToken>> queue_;
    size_t                                      unfinished_jobs_;
    bool                                        stopping_;
    mutable std::mutex                          mutex_;
    std::condition_variable                     cv_job_available_;
    std::condition_variable                     cv_idle_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_THREADPOOL_HPP_
