#ifndef XFER_TRANSFER_TRANSFERSUBSCRIBER_HPP_
#define XFER_TRANSFER_TRANSFERSUBSCRIBER_HPP_

#include <cstdint>

#include "transferfuture.hpp"

namespace xfer::transfer
{
/**
 * Receives the lifecycle notifications of a transfer.
 *
 * Notifications for one transfer are delivered serially: on_queued first, then any number of
 * on_progress calls, then on_done. Notifications for different transfers may be delivered
 * concurrently from different threads.
 */
class TransferSubscriber
{
public:
    virtual ~TransferSubscriber() = default;

    virtual void on_queued(const TransferFuture &future) = 0;
    virtual void on_progress(const TransferFuture &future, uint64_t bytes_transferred) = 0;
    virtual void on_done(const TransferFuture &future)                                  = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERSUBSCRIBER_HPP_
