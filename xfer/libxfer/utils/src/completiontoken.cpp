#include "completiontoken.hpp"

#include <condition_variable>
#include <mutex>

namespace xfer::utils
{
struct CompletionToken::State
{
    std::mutex              mutex;
    std::condition_variable cv_completed;
    bool                    cancelled = false;
    bool                    completed = false;
};

CompletionToken::CompletionToken()
    : state_ {std::make_shared<State>()}
{}

void CompletionToken::cancel() const
{
    std::lock_guard<std::mutex> lock {state_->mutex};
    state_->cancelled = true;
}

void CompletionToken::complete() const
{
    {
        std::lock_guard<std::mutex> lock {state_->mutex};
        if (state_->completed)
        {
            return;
        }
        state_->completed = true;
    }
    state_->cv_completed.notify_all();
}

bool CompletionToken::is_cancelled() const
{
    std::lock_guard<std::mutex> lock {state_->mutex};
    return state_->cancelled;
}

bool CompletionToken::is_completed() const
{
    std::lock_guard<std::mutex> lock {state_->mutex};
    return state_->completed;
}

void CompletionToken::wait_for_completion() const
{
    std::unique_lock<std::mutex> lock {state_->mutex};
    state_->cv_completed.wait(lock, [this] { return state_->completed; });
}

bool CompletionToken::wait_for_completion(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock {state_->mutex};
    return state_->cv_completed.wait_for(lock, timeout, [this] { return state_->completed; });
}
}  // namespace xfer::utils
