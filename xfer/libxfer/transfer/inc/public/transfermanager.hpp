#ifndef XFER_TRANSFER_TRANSFERMANAGER_HPP_
#define XFER_TRANSFER_TRANSFERMANAGER_HPP_

#include <memory>
#include <string>
#include <vector>

#include "transferfuture.hpp"
#include "transfersubscriber.hpp"

namespace xfer::transfer
{
class TransferManager
{
public:
    using Subscribers = std::vector<std::shared_ptr<TransferSubscriber>>;

    virtual ~TransferManager() = default;

    virtual std::shared_ptr<TransferFuture> upload(const std::string &fileobj,
        const std::string &bucket, const std::string &key, const Subscribers &subscribers) = 0;
    virtual std::shared_ptr<TransferFuture> download(const std::string &bucket,
        const std::string &key, const std::string &fileobj, const Subscribers &subscribers) = 0;
    virtual std::shared_ptr<TransferFuture> copy(const CopySource &copy_source,
        const std::string &bucket, const std::string &key, const Subscribers &subscribers)  = 0;

    // Blocks until every submitted transfer is done
    virtual void wait_for_all() = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERMANAGER_HPP_
