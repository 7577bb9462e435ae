#include "threadpool.hpp"

#include <algorithm>
#include <exception>

#include <glog/logging.h>

namespace xfer::utils
{
ThreadPool::ThreadPool(std::string name, size_t thread_count)
    : name_ {std::move(name)}
    , unfinished_jobs_ {0}
    , stopping_ {false}
{
    thread_count = std::max<size_t>(thread_count, 1);
    workers_.reserve(thread_count);
    for (size_t i = 0; i != thread_count; ++i)
    {
        workers_.emplace_back(&ThreadPool::worker_routine, this, i);
    }
    DLOG(INFO) << "Thread pool " << name_ << " started with " << thread_count << " worker(s)";
}

ThreadPool::~ThreadPool()
{
    std::deque<std::pair<Job, CompletionToken>> dropped;
    {
        std::lock_guard<std::mutex> lock {mutex_};
        stopping_ = true;
        dropped.swap(queue_);
    }
    cv_job_available_.notify_all();

    for (auto &worker : workers_)
    {
        worker.join();
    }

    if (!dropped.empty())
    {
        LOG(WARNING) << "Thread pool " << name_ << " dropped " << dropped.size()
                     << " pending job(s)";
    }
    for (auto &[job, completion_token] : dropped)
    {
        completion_token.cancel();
        completion_token.complete();
    }
}

CompletionToken ThreadPool::add_job(Job &&job)
{
    CompletionToken completion_token;
    {
        std::lock_guard<std::mutex> lock {mutex_};
        queue_.emplace_back(std::move(job), completion_token);
        ++unfinished_jobs_;
    }
    cv_job_available_.notify_one();
    return completion_token;
}

void ThreadPool::wait_idle()
{
    std::unique_lock<std::mutex> lock {mutex_};
    cv_idle_.wait(lock, [this] { return unfinished_jobs_ == 0 || stopping_; });
}

size_t ThreadPool::pending_jobs() const
{
    std::lock_guard<std::mutex> lock {mutex_};
    return queue_.size();
}

size_t ThreadPool::thread_count() const
{
    return workers_.size();
}

const std::string &ThreadPool::name() const
{
    return name_;
}

void ThreadPool::worker_routine(size_t worker_index)
{
    for (;;)
    {
        std::unique_lock<std::mutex> lock {mutex_};
        cv_job_available_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (stopping_)
        {
            break;
        }

        auto [job, completion_token] = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        if (completion_token.is_cancelled())
        {
            DLOG(INFO) << "Thread pool " << name_ << '/' << worker_index
                       << " skipping cancelled job";
        }
        else
        {
            run_job(job, completion_token);
        }
        completion_token.complete();

        lock.lock();
        if (--unfinished_jobs_ == 0)
        {
            lock.unlock();
            cv_idle_.notify_all();
        }
    }
}

void ThreadPool::run_job(const Job &job, const CompletionToken &completion_token) const
{
    try
    {
        job(completion_token);
    }
    catch (const std::exception &e)
    {
        LOG(ERROR) << "Uncaught exception in thread pool " << name_ << ": " << e.what();
    }
}
}  // namespace xfer::utils
