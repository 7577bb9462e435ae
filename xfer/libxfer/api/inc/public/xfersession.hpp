#ifndef XFER_API_XFERSESSION_HPP_
#define XFER_API_XFERSESSION_HPP_

#include <ostream>
#include <string>

#include "commandresult.hpp"
#include "config.hpp"
#include "localtransfermanager.hpp"

namespace xfer
{
/**
 * Entry point for running transfer commands against the object store configured in
 * {app_data_dir_path}/{config_file_name}.
 */
class XferSession
{
public:
    XferSession(std::string app_data_dir_path, const std::string &config_file_name);
    XferSession(const XferSession &) = delete;
    XferSession &operator=(const XferSession &) = delete;

    /**
     * Copies files between the local file system and the object store, or within the object
     * store. Progress goes to out_stream, failures and warnings to err_stream.
     */
    results::CommandResult copy(const std::string &src, const std::string &dest,
        std::ostream &out_stream, std::ostream &err_stream);

    /**
     * @param bucket_uri "s3://{bucket}"
     */
    bool make_bucket(const std::string &bucket_uri, std::string &error_message);

    [[nodiscard]] const config::Config &config() const;

private:
    const std::string               app_data_dir_path_;
    const config::Config            cfg_;
    const std::string               object_store_dir_;
    transfer::LocalTransferManager  transfer_manager_;
};
}  // namespace xfer

#endif  // XFER_API_XFERSESSION_HPP_
