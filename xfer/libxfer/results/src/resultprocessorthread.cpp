#include "resultprocessorthread.hpp"

#include <glog/logging.h>

#include "resultprocessor.hpp"

namespace xfer::results
{
ResultProcessorThread::ResultProcessorThread(ResultProcessor &result_processor)
    : result_processor_ {result_processor}
    , thread_ {"results", 1}
{}

bool ResultProcessorThread::start()
{
    if (completion_token_)
    {
        LOG(WARNING) << "Result processor already started";
        return false;
    }

    completion_token_ =
        thread_.add_job([this](const utils::CompletionToken &) { result_processor_.run(); });
    LOG(INFO) << "Result processor started";
    return true;
}

void ResultProcessorThread::join()
{
    if (!completion_token_)
    {
        LOG(WARNING) << "Result processor was never started";
        return;
    }
    completion_token_->wait_for_completion();
}

bool ResultProcessorThread::is_running() const
{
    return completion_token_ && !completion_token_->is_completed();
}

CommandResult ResultProcessorThread::get_final_result() const
{
    if (is_running())
    {
        LOG(ERROR) << "Final result requested while results are still being processed";
    }
    return result_processor_.get_final_result();
}
}  // namespace xfer::results
