#ifndef XFER_TRANSFER_TRANSFERFUTURE_HPP_
#define XFER_TRANSFER_TRANSFERFUTURE_HPP_

#include <cstdint>
#include <future>
#include <string>

namespace xfer::transfer
{
struct CopySource
{
    std::string bucket;
    std::string key;
};

// Arguments the transfer was submitted with
struct CallArgs
{
    std::string bucket;
    std::string key;
    std::string fileobj;  // Local file path, "-" for standard input / output
    CopySource  copy_source;
};

struct TransferMeta
{
    CallArgs call_args;
    uint64_t size;
};

/**
 * Handle to a transfer submitted to a TransferManager.
 */
class TransferFuture
{
public:
    TransferFuture(TransferMeta meta, std::shared_future<void> result);

    [[nodiscard]] const TransferMeta &meta() const;
    [[nodiscard]] bool                done() const;
    void                              wait() const;

    /**
     * Waits for the transfer to finish and rethrows the exception it failed with, if any.
     */
    void result() const;

private:
    TransferMeta             meta_;
    std::shared_future<void> result_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERFUTURE_HPP_
