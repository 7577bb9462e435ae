#include "localtransfermanager.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include "mappedfile.hpp"

namespace xfer::transfer
{
namespace
{
uint64_t file_size_or_zero(const std::string &path)
{
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    return ec ? 0 : uint64_t(size);
}
}  // namespace

LocalTransferManager::LocalTransferManager(
    std::string object_store_dir, size_t max_concurrent_requests, uint64_t chunk_size)
    : object_store_dir_ {std::move(object_store_dir)}
    , chunk_size_ {std::max<uint64_t>(chunk_size, 1)}
    , thread_pool_ {"transfer", max_concurrent_requests}
{}

std::shared_ptr<TransferFuture> LocalTransferManager::upload(const std::string &fileobj,
    const std::string &bucket, const std::string &key, const Subscribers &subscribers)
{
    CallArgs call_args;
    call_args.bucket  = bucket;
    call_args.key     = key;
    call_args.fileobj = fileobj;
    return submit(std::move(call_args), fileobj, object_path(bucket, key), bucket, subscribers);
}

std::shared_ptr<TransferFuture> LocalTransferManager::download(const std::string &bucket,
    const std::string &key, const std::string &fileobj, const Subscribers &subscribers)
{
    CallArgs call_args;
    call_args.bucket  = bucket;
    call_args.key     = key;
    call_args.fileobj = fileobj;
    return submit(std::move(call_args), object_path(bucket, key), fileobj, "", subscribers);
}

std::shared_ptr<TransferFuture> LocalTransferManager::copy(const CopySource &copy_source,
    const std::string &bucket, const std::string &key, const Subscribers &subscribers)
{
    CallArgs call_args;
    call_args.bucket      = bucket;
    call_args.key         = key;
    call_args.copy_source = copy_source;
    return submit(std::move(call_args), object_path(copy_source.bucket, copy_source.key),
        object_path(bucket, key), bucket, subscribers);
}

void LocalTransferManager::wait_for_all()
{
    thread_pool_.wait_idle();
}

std::string LocalTransferManager::object_path(
    const std::string &bucket, const std::string &key) const
{
    return (std::filesystem::path {object_store_dir_} / bucket / key).string();
}

std::shared_ptr<TransferFuture> LocalTransferManager::submit(CallArgs call_args,
    std::string src_path, std::string dest_path, const std::string &dest_bucket,
    const Subscribers &subscribers)
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future  = std::make_shared<TransferFuture>(
        TransferMeta {std::move(call_args), file_size_or_zero(src_path)},
        promise->get_future().share());

    for (const auto &subscriber : subscribers)
    {
        subscriber->on_queued(*future);
    }

    thread_pool_.add_job([this, promise, future, subscribers, src_path = std::move(src_path),
                             dest_path = std::move(dest_path),
                             dest_bucket](const utils::CompletionToken &) {
        try
        {
            transfer_file(src_path, dest_path, dest_bucket, *future, subscribers);
            promise->set_value();
        }
        catch (const std::exception &e)
        {
            LOG(WARNING) << "Transfer " << src_path << " -> " << dest_path
                         << " failed: " << e.what();
            promise->set_exception(std::current_exception());
        }

        for (const auto &subscriber : subscribers)
        {
            subscriber->on_done(*future);
        }
    });

    return future;
}

void LocalTransferManager::transfer_file(const std::string &src_path,
    const std::string &dest_path, const std::string &dest_bucket, const TransferFuture &future,
    const Subscribers &subscribers) const
{
    namespace fs = std::filesystem;

    if (!fs::is_regular_file(src_path))
    {
        throw std::runtime_error {"No such file or object: " + src_path};
    }

    if (!dest_bucket.empty() && !fs::is_directory(fs::path {object_store_dir_} / dest_bucket))
    {
        throw std::runtime_error {"The specified bucket does not exist: " + dest_bucket};
    }

    std::error_code ec;
    if (fs::exists(dest_path, ec) && fs::equivalent(src_path, dest_path, ec))
    {
        throw std::runtime_error {"Source and destination are the same file: " + src_path};
    }

    auto parent_dir = fs::path {dest_path}.parent_path();
    if (!parent_dir.empty())
    {
        fs::create_directories(parent_dir, ec);
        if (ec)
        {
            throw std::runtime_error {
                "Cannot create directory " + parent_dir.string() + ": " + ec.message()};
        }
    }

    auto size = file_size_or_zero(src_path);
    LOG(INFO) << "Transferring " << src_path << " -> " << dest_path << " ("
              << size_formatter_.format_human_readable(size) << ")";

    if (size == 0)
    {
        std::ofstream fs {dest_path, std::ios::out | std::ios::binary | std::ios::trunc};
        if (!fs)
        {
            throw std::runtime_error {"Cannot open " + dest_path + " for writing"};
        }
        return;
    }

    std::string error_message;
    auto        src_file = storage::MappedFile::open(src_path, error_message);
    if (!src_file)
    {
        throw std::runtime_error {"Cannot read " + src_path + ": " + error_message};
    }

    auto dest_file = storage::MappedFile::create(dest_path, size, error_message);
    if (!dest_file)
    {
        throw std::runtime_error {"Cannot write " + dest_path + ": " + error_message};
    }

    for (uint64_t offset = 0; offset < size;)
    {
        size_t copied = dest_file->copy_from(*src_file, offset, size_t(chunk_size_));
        if (copied == 0)
        {
            throw std::runtime_error {
                "Copy error at offset " + std::to_string(offset) + " of " + src_path};
        }

        offset += copied;
        for (const auto &subscriber : subscribers)
        {
            subscriber->on_progress(future, copied);
        }
    }

    if (!dest_file->flush())
    {
        throw std::runtime_error {"Cannot flush " + dest_path};
    }
}
}  // namespace xfer::transfer
