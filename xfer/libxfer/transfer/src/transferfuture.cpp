#include "transferfuture.hpp"

#include <chrono>
#include <utility>

namespace xfer::transfer
{
TransferFuture::TransferFuture(TransferMeta meta, std::shared_future<void> result)
    : meta_ {std::move(meta)}
    , result_ {std::move(result)}
{}

const TransferMeta &TransferFuture::meta() const
{
    return meta_;
}

bool TransferFuture::done() const
{
    return result_.wait_for(std::chrono::seconds {0}) == std::future_status::ready;
}

void TransferFuture::wait() const
{
    result_.wait();
}

void TransferFuture::result() const
{
    result_.get();
}
}  // namespace xfer::transfer
