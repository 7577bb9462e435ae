#include "transferhandler.hpp"

#include <exception>

#include <glog/logging.h>

#include "onlyshowerrorsresultprinter.hpp"
#include "pathutils.hpp"
#include "resultprinterimpl.hpp"
#include "transfermanager.hpp"

namespace xfer::transfer
{
namespace
{
std::unique_ptr<results::ResultPrinter> make_result_printer(const TransferHandlerParams &params,
    const results::ResultRecorder &result_recorder, std::ostream &out_stream,
    std::ostream &err_stream)
{
    if (params.quiet)
    {
        return nullptr;
    }
    if (params.only_show_errors)
    {
        return std::make_unique<results::OnlyShowErrorsResultPrinter>(
            result_recorder, out_stream, err_stream);
    }
    return std::make_unique<results::ResultPrinterImpl>(result_recorder, out_stream, err_stream);
}
}  // namespace

TransferHandler::TransferHandler(TransferManager &transfer_manager,
    results::ResultQueue &result_queue, const TransferHandlerParams &params,
    std::ostream &out_stream, std::ostream &err_stream)
    : transfer_manager_ {transfer_manager}
    , result_queue_ {result_queue}
    , result_printer_ {make_result_printer(params, result_recorder_, out_stream, err_stream)}
    , result_processor_ {result_queue_, result_recorder_, result_printer_.get()}
    , result_processor_thread_ {result_processor_}
    , upload_subscriber_ {std::make_shared<results::UploadResultSubscriber>(result_queue_)}
    , download_subscriber_ {std::make_shared<results::DownloadResultSubscriber>(result_queue_)}
    , copy_subscriber_ {std::make_shared<results::CopyResultSubscriber>(result_queue_)}
{}

results::CommandResult TransferHandler::call(const FileInfoProvider &file_info_provider)
{
    if (!result_processor_thread_.start())
    {
        LOG(ERROR) << "Transfer handler cannot be called more than once";
        return {0, 0, 1};
    }

    try
    {
        file_info_provider([this](const FileInfo &file_info) {
            if (!warn_and_signal_if_skip(file_info))
            {
                enqueue(file_info);
            }
        });
    }
    catch (const std::exception &e)
    {
        LOG(WARNING) << "Exception caught while submitting transfers: " << e.what();
        result_queue_.push(results::ErrorResult {e.what()});
    }

    // Transfers already submitted keep reporting results until they are done
    transfer_manager_.wait_for_all();
    shutdown();

    return result_processor_thread_.get_final_result();
}

results::CommandResult TransferHandler::call(const std::vector<FileInfo> &file_infos)
{
    return call([&file_infos](const FileInfoCallback &callback) {
        for (const auto &file_info : file_infos)
        {
            callback(file_info);
        }
    });
}

const results::ResultRecorder &TransferHandler::result_recorder() const
{
    return result_recorder_;
}

void TransferHandler::enqueue(const FileInfo &file_info)
{
    std::string bucket;
    std::string key;

    switch (file_info.operation)
    {
        case results::TransferType::UPLOAD:
        {
            utils::split_bucket_key(file_info.dest, bucket, key);
            transfer_manager_.upload(file_info.src, bucket, key, {upload_subscriber_});
            break;
        }
        case results::TransferType::DOWNLOAD:
        {
            utils::split_bucket_key(file_info.src, bucket, key);
            transfer_manager_.download(bucket, key, file_info.dest, {download_subscriber_});
            break;
        }
        case results::TransferType::COPY:
        {
            CopySource copy_source;
            utils::split_bucket_key(file_info.src, copy_source.bucket, copy_source.key);
            utils::split_bucket_key(file_info.dest, bucket, key);
            transfer_manager_.copy(copy_source, bucket, key, {copy_subscriber_});
            break;
        }
    }
}

bool TransferHandler::warn_and_signal_if_skip(const FileInfo &file_info)
{
    if (file_info.operation == results::TransferType::UPLOAD && file_info.size > max_upload_size)
    {
        result_queue_.push(results::make_warning(
            utils::relative_path(file_info.src), "File exceeds s3 upload limit of 5 TB."));
        return true;
    }
    return false;
}

void TransferHandler::shutdown()
{
    result_queue_.push(results::ShutdownRequest {});
    result_processor_thread_.join();
    LOG(INFO) << "Result processing finished";
}
}  // namespace xfer::transfer
