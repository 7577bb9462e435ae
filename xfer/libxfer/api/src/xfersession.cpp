#include "xfersession.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include "defaultconfigvalues.hpp"
#include "fileinfogenerator.hpp"
#include "jsonconfigloader.hpp"
#include "pathutils.hpp"
#include "resultqueue.hpp"
#include "transferhandler.hpp"

namespace
{
std::string path_join(const std::string &directory, const std::string &file_name)
{
    return (std::filesystem::path {directory} / file_name).string();
}
}  // namespace

namespace xfer
{
XferSession::XferSession(std::string app_data_dir_path, const std::string &config_file_name)
    : app_data_dir_path_ {std::move(app_data_dir_path)}
    , cfg_ {config::JSONConfigLoader {path_join(app_data_dir_path_, config_file_name)},
          DefaultConfigValues {app_data_dir_path_}}
    , object_store_dir_ {cfg_.get_string(config::ConfigKey::OBJECT_STORE_DIR)}
    , transfer_manager_ {object_store_dir_,
          size_t(cfg_.get_size(config::ConfigKey::MAX_CONCURRENT_REQUESTS)),
          cfg_.get_size(config::ConfigKey::MULTIPART_CHUNKSIZE)}
{
    LOG(INFO) << "Object store directory: " << object_store_dir_;
}

results::CommandResult XferSession::copy(const std::string &src, const std::string &dest,
    std::ostream &out_stream, std::ostream &err_stream)
{
    results::ResultQueue result_queue {
        size_t(cfg_.get_size(config::ConfigKey::MAX_QUEUE_SIZE))};

    transfer::TransferHandlerParams params;
    params.quiet            = cfg_.get_bool(config::ConfigKey::QUIET);
    params.only_show_errors = cfg_.get_bool(config::ConfigKey::ONLY_SHOW_ERRORS);

    transfer::FileInfoGenerator file_info_generator {object_store_dir_, result_queue};
    transfer::TransferHandler   handler {
        transfer_manager_, result_queue, params, out_stream, err_stream};

    LOG(INFO) << "Copying " << src << " to " << dest;

    return handler.call([&](const transfer::FileInfoCallback &callback) {
        std::string error_message;
        if (!file_info_generator.generate(src, dest, callback, error_message))
        {
            result_queue.push(results::ErrorResult {error_message});
        }
    });
}

bool XferSession::make_bucket(const std::string &bucket_uri, std::string &error_message)
{
    std::string bucket;
    std::string key;
    if (transfer::FileInfoGenerator::is_remote(bucket_uri))
    {
        utils::split_bucket_key(bucket_uri.substr(5), bucket, key);
    }

    if (bucket.empty() || !key.empty())
    {
        error_message = "Invalid bucket URI " + bucket_uri + ", expected s3://{bucket}";
        return false;
    }

    auto            bucket_dir = std::filesystem::path {object_store_dir_} / bucket;
    std::error_code ec;
    if (std::filesystem::is_directory(bucket_dir))
    {
        error_message = "Bucket " + bucket + " already exists";
        return false;
    }

    std::filesystem::create_directories(bucket_dir, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot create " << bucket_dir << ": " << ec.message();
        error_message = "Cannot create bucket " + bucket + ": " + ec.message();
        return false;
    }

    return true;
}

const config::Config &XferSession::config() const
{
    return cfg_;
}
}  // namespace xfer
