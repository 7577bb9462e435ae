#ifndef XFER_RESULTS_RESULTQUEUE_HPP_
#define XFER_RESULTS_RESULTQUEUE_HPP_

#include "blockingqueue.hpp"
#include "results.hpp"

namespace xfer::results
{
using ResultQueue = utils::BlockingQueue<Result>;
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTQUEUE_HPP_
