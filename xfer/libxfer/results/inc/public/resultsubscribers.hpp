#ifndef XFER_RESULTS_RESULTSUBSCRIBERS_HPP_
#define XFER_RESULTS_RESULTSUBSCRIBERS_HPP_

#include <string>
#include <utility>

#include "resultqueue.hpp"
#include "results.hpp"
#include "transfersubscriber.hpp"

namespace xfer::results
{
/**
 * Translates transfer notifications into results and pushes them to the result queue.
 *
 * A single instance may be attached to many transfers running concurrently, the queue is the
 * only shared state.
 */
class BaseResultSubscriber : public transfer::TransferSubscriber
{
public:
    BaseResultSubscriber(ResultQueue &result_queue, TransferType transfer_type);

    void on_queued(const transfer::TransferFuture &future) override;
    void on_progress(const transfer::TransferFuture &future, uint64_t bytes_transferred) override;
    void on_done(const transfer::TransferFuture &future) override;

protected:
    using SrcDest = std::pair<std::string, std::string>;

    [[nodiscard]] virtual SrcDest get_src_dest(const transfer::TransferFuture &future) const = 0;

private:
    ResultQueue &      result_queue_;
    const TransferType transfer_type_;
};

class UploadResultSubscriber : public BaseResultSubscriber
{
public:
    explicit UploadResultSubscriber(ResultQueue &result_queue);

protected:
    [[nodiscard]] SrcDest get_src_dest(const transfer::TransferFuture &future) const override;
    [[nodiscard]] virtual std::string get_src(const std::string &fileobj) const;
};

// Upload from standard input
class UploadStreamResultSubscriber : public UploadResultSubscriber
{
public:
    using UploadResultSubscriber::UploadResultSubscriber;

protected:
    [[nodiscard]] std::string get_src(const std::string &fileobj) const override;
};

class DownloadResultSubscriber : public BaseResultSubscriber
{
public:
    explicit DownloadResultSubscriber(ResultQueue &result_queue);

protected:
    [[nodiscard]] SrcDest get_src_dest(const transfer::TransferFuture &future) const override;
    [[nodiscard]] virtual std::string get_dest(const std::string &fileobj) const;
};

// Download to standard output
class DownloadStreamResultSubscriber : public DownloadResultSubscriber
{
public:
    using DownloadResultSubscriber::DownloadResultSubscriber;

protected:
    [[nodiscard]] std::string get_dest(const std::string &fileobj) const override;
};

class CopyResultSubscriber : public BaseResultSubscriber
{
public:
    explicit CopyResultSubscriber(ResultQueue &result_queue);

protected:
    [[nodiscard]] SrcDest get_src_dest(const transfer::TransferFuture &future) const override;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTSUBSCRIBERS_HPP_
