#ifndef XFER_UTILS_COMPLETIONTOKEN_HPP_
#define XFER_UTILS_COMPLETIONTOKEN_HPP_

#include <chrono>
#include <memory>

namespace xfer::utils
{
/**
 * Shared handle on the state of a queued job. Copies refer to the same job; the pool completes
 * the token once the job ran or was dropped, cancel() only prevents a job that has not started.
 */
class CompletionToken
{
public:
    CompletionToken();

    void               cancel() const;
    void               complete() const;
    [[nodiscard]] bool is_cancelled() const;
    [[nodiscard]] bool is_completed() const;
    void               wait_for_completion() const;
    [[nodiscard]] bool wait_for_completion(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_COMPLETIONTOKEN_HPP_
