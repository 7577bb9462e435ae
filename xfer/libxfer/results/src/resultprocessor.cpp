#include "resultprocessor.hpp"

#include <exception>

#include <glog/logging.h>

#include "resultprinter.hpp"
#include "resultrecorder.hpp"

namespace xfer::results
{
ResultProcessor::ResultProcessor(
    ResultQueue &result_queue, ResultRecorder &result_recorder, ResultPrinter *result_printer)
    : result_queue_ {result_queue}
    , result_recorder_ {result_recorder}
    , result_printer_ {result_printer}
{}

void ResultProcessor::run()
{
    for (;;)
    {
        Result result = result_queue_.pop();
        if (std::holds_alternative<ShutdownRequest>(result))
        {
            LOG(INFO) << "Shutdown request received, stopping result processing";
            break;
        }
        process_result(result);
    }
}

CommandResult ResultProcessor::get_final_result() const
{
    return {result_recorder_.files_failed(), result_recorder_.files_warned(),
        result_recorder_.errors()};
}

void ResultProcessor::process_result(const Result &result)
{
    result_recorder_.record(result);

    if (!result_printer_)
    {
        return;
    }

    try
    {
        result_printer_->print(result);
    }
    catch (const std::exception &e)
    {
        LOG(WARNING) << "Error printing result: " << e.what();
    }
    catch (...)
    {
        LOG(WARNING) << "Unknown error printing result";
    }
}
}  // namespace xfer::results
