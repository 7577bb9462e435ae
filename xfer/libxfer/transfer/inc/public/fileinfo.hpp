#ifndef XFER_TRANSFER_FILEINFO_HPP_
#define XFER_TRANSFER_FILEINFO_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "results.hpp"

namespace xfer::transfer
{
/**
 * One file to transfer. Local files are plain paths, objects are written as "bucket/key".
 */
struct FileInfo
{
    results::TransferType operation;
    std::string           src;
    std::string           dest;
    uint64_t              size;
};

using FileInfoCallback = std::function<void(const FileInfo &)>;
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_FILEINFO_HPP_
