#include "results.hpp"

#include <glog/logging.h>

namespace xfer::results
{
std::string to_string(TransferType transfer_type)
{
    switch (transfer_type)
    {
        case TransferType::UPLOAD: return "upload";
        case TransferType::DOWNLOAD: return "download";
        case TransferType::COPY: return "copy";
        default:
        {
            LOG(ERROR) << "Unknown transfer type " << int(transfer_type);
            return "";
        }
    }
}

WarningResult make_warning(const std::string &path, const std::string &message)
{
    return WarningResult {"Skipping file " + path + ". " + message};
}
}  // namespace xfer::results
