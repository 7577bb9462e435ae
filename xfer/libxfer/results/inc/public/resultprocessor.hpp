#ifndef XFER_RESULTS_RESULTPROCESSOR_HPP_
#define XFER_RESULTS_RESULTPROCESSOR_HPP_

#include "commandresult.hpp"
#include "resultqueue.hpp"

namespace xfer::results
{
// Forward declarations
class ResultRecorder;
class ResultPrinter;

/**
 * Consumer side of the result queue.
 *
 * Every result is recorded before being printed, so a failing printer never loses statistics.
 */
class ResultProcessor
{
public:
    /**
     * @param result_queue Queue shared with the result producers
     * @param result_recorder Statistics sink, used exclusively by the thread calling run()
     * @param result_printer Optional, nullptr means nothing gets printed
     */
    ResultProcessor(
        ResultQueue &result_queue, ResultRecorder &result_recorder, ResultPrinter *result_printer);

    /**
     * Processes results until a ShutdownRequest is popped from the queue. Results pushed after the
     * ShutdownRequest are left in the queue.
     */
    void run();

    /**
     * Final tally. Only meaningful after run() returned.
     */
    [[nodiscard]] CommandResult get_final_result() const;

private:
    void process_result(const Result &result);

    ResultQueue &   result_queue_;
    ResultRecorder &result_recorder_;
    ResultPrinter * result_printer_;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTPROCESSOR_HPP_
