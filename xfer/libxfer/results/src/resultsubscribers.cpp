#include "resultsubscribers.hpp"

#include <exception>

#include "pathutils.hpp"

namespace xfer::results
{
namespace
{
constexpr char const *stream_path = "-";
}  // namespace

BaseResultSubscriber::BaseResultSubscriber(ResultQueue &result_queue, TransferType transfer_type)
    : result_queue_ {result_queue}
    , transfer_type_ {transfer_type}
{}

void BaseResultSubscriber::on_queued(const transfer::TransferFuture &future)
{
    auto [src, dest] = get_src_dest(future);
    result_queue_.push(
        QueuedResult {transfer_type_, std::move(src), std::move(dest), future.meta().size});
}

void BaseResultSubscriber::on_progress(
    const transfer::TransferFuture &future, uint64_t bytes_transferred)
{
    auto [src, dest] = get_src_dest(future);
    result_queue_.push(ProgressResult {
        transfer_type_, std::move(src), std::move(dest), bytes_transferred, future.meta().size});
}

void BaseResultSubscriber::on_done(const transfer::TransferFuture &future)
{
    auto [src, dest] = get_src_dest(future);
    try
    {
        future.result();
    }
    catch (const std::exception &e)
    {
        result_queue_.push(
            FailureResult {transfer_type_, std::move(src), std::move(dest), e.what()});
        return;
    }
    result_queue_.push(SuccessResult {transfer_type_, std::move(src), std::move(dest)});
}

UploadResultSubscriber::UploadResultSubscriber(ResultQueue &result_queue)
    : BaseResultSubscriber {result_queue, TransferType::UPLOAD}
{}

UploadResultSubscriber::SrcDest UploadResultSubscriber::get_src_dest(
    const transfer::TransferFuture &future) const
{
    const auto &call_args = future.meta().call_args;
    return {get_src(call_args.fileobj), utils::remote_uri(call_args.bucket, call_args.key)};
}

std::string UploadResultSubscriber::get_src(const std::string &fileobj) const
{
    return utils::relative_path(fileobj);
}

std::string UploadStreamResultSubscriber::get_src(const std::string & /*fileobj*/) const
{
    return stream_path;
}

DownloadResultSubscriber::DownloadResultSubscriber(ResultQueue &result_queue)
    : BaseResultSubscriber {result_queue, TransferType::DOWNLOAD}
{}

DownloadResultSubscriber::SrcDest DownloadResultSubscriber::get_src_dest(
    const transfer::TransferFuture &future) const
{
    const auto &call_args = future.meta().call_args;
    return {utils::remote_uri(call_args.bucket, call_args.key), get_dest(call_args.fileobj)};
}

std::string DownloadResultSubscriber::get_dest(const std::string &fileobj) const
{
    return utils::relative_path(fileobj);
}

std::string DownloadStreamResultSubscriber::get_dest(const std::string & /*fileobj*/) const
{
    return stream_path;
}

CopyResultSubscriber::CopyResultSubscriber(ResultQueue &result_queue)
    : BaseResultSubscriber {result_queue, TransferType::COPY}
{}

CopyResultSubscriber::SrcDest CopyResultSubscriber::get_src_dest(
    const transfer::TransferFuture &future) const
{
    const auto &call_args = future.meta().call_args;
    return {utils::remote_uri(call_args.copy_source.bucket, call_args.copy_source.key),
        utils::remote_uri(call_args.bucket, call_args.key)};
}
}  // namespace xfer::results
