#ifndef XFER_RESULTS_RESULTPROCESSORTHREAD_HPP_
#define XFER_RESULTS_RESULTPROCESSORTHREAD_HPP_

#include <optional>

#include "commandresult.hpp"
#include "completiontoken.hpp"
#include "threadpool.hpp"

namespace xfer::results
{
// Forward declarations
class ResultProcessor;

// Runs a ResultProcessor on a dedicated thread
class ResultProcessorThread
{
public:
    explicit ResultProcessorThread(ResultProcessor &result_processor);
    ResultProcessorThread(const ResultProcessorThread &) = delete;
    ResultProcessorThread &operator=(const ResultProcessorThread &) = delete;

    bool start();

    // Waits for the processor to receive its ShutdownRequest
    void join();

    [[nodiscard]] bool          is_running() const;
    [[nodiscard]] CommandResult get_final_result() const;

private:
    ResultProcessor &                     result_processor_;
    utils::ThreadPool                     thread_;
    std::optional<utils::CompletionToken> completion_token_;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTPROCESSORTHREAD_HPP_
