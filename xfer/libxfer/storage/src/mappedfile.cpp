#include "mappedfile.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <glog/logging.h>

namespace xfer::storage
{
namespace ipc = boost::interprocess;

MappedFile::MappedFile(std::string path, bool writable)
    : path_ {std::move(path)}
    , writable_ {writable}
{}

std::unique_ptr<MappedFile> MappedFile::open(const std::string &path, std::string &error_message)
{
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        error_message = ec.message();
        return nullptr;
    }
    if (size == 0)
    {
        error_message = "Cannot map an empty file";
        return nullptr;
    }

    std::unique_ptr<MappedFile> file {new MappedFile {path, false}};
    if (!file->map(error_message))
    {
        return nullptr;
    }
    return file;
}

std::unique_ptr<MappedFile> MappedFile::create(
    const std::string &path, uint64_t size, std::string &error_message)
{
    if (size == 0)
    {
        error_message = "Cannot map an empty file";
        return nullptr;
    }

    {
        std::ofstream fs {path, std::ios::out | std::ios::binary | std::ios::trunc};
        if (!fs)
        {
            error_message = "Cannot open file for writing";
            LOG(ERROR) << "Cannot open " << path << " for writing";
            return nullptr;
        }
    }

    std::error_code ec;
    std::filesystem::resize_file(path, size, ec);
    if (ec)
    {
        error_message = ec.message();
        LOG(ERROR) << "Cannot resize " << path << " to " << size << " bytes: " << ec.message();
        return nullptr;
    }

    std::unique_ptr<MappedFile> file {new MappedFile {path, true}};
    if (!file->map(error_message))
    {
        return nullptr;
    }
    return file;
}

bool MappedFile::map(std::string &error_message)
{
    auto mode = writable_ ? ipc::read_write : ipc::read_only;
    try
    {
        mapping_ = ipc::file_mapping {path_.c_str(), mode};
        region_  = ipc::mapped_region {mapping_, mode};
    }
    catch (const ipc::interprocess_exception &e)
    {
        error_message = e.what();
        LOG(ERROR) << "Cannot map " << path_ << ": " << e.what();
        return false;
    }
    return true;
}

size_t MappedFile::copy_from(const MappedFile &src, uint64_t offset, size_t amount) const
{
    if (!writable_)
    {
        LOG(ERROR) << path_ << " is mapped read only";
        return 0;
    }
    if (offset >= size() || offset >= src.size())
    {
        LOG(ERROR) << "Offset " << offset << " out of range. src = " << src.path()
                   << " (" << src.size() << " bytes); dest = " << path_ << " (" << size()
                   << " bytes)";
        return 0;
    }

    auto count = size_t(std::min<uint64_t>({amount, size() - offset, src.size() - offset}));
    std::copy_n(src.data() + offset, count, static_cast<uint8_t *>(region_.get_address()) + offset);
    return count;
}

bool MappedFile::flush()
{
    if (!writable_)
    {
        return true;
    }
    if (!region_.flush())
    {
        LOG(ERROR) << "Cannot flush " << path_;
        return false;
    }
    return true;
}

const uint8_t *MappedFile::data() const
{
    return static_cast<const uint8_t *>(region_.get_address());
}

uint64_t MappedFile::size() const
{
    return region_.get_size();
}

bool MappedFile::is_writable() const
{
    return writable_;
}

const std::string &MappedFile::path() const
{
    return path_;
}
}  // namespace xfer::storage
