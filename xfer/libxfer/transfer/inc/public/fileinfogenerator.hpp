#ifndef XFER_TRANSFER_FILEINFOGENERATOR_HPP_
#define XFER_TRANSFER_FILEINFOGENERATOR_HPP_

#include <filesystem>
#include <string>
#include <vector>

#include "fileinfo.hpp"
#include "resultqueue.hpp"

namespace xfer::transfer
{
/**
 * Expands a source / destination pair of command arguments into the files to transfer.
 *
 * Arguments are either local paths or "s3://bucket/key" URIs. Directories and key prefixes are
 * expanded recursively. Files which cannot be transferred are reported to the result queue as
 * warnings and skipped.
 */
class FileInfoGenerator
{
public:
    FileInfoGenerator(std::string object_store_dir, results::ResultQueue &result_queue);

    /**
     * Calls callback once per file, in lexicographical order of the source paths.
     *
     * @return false if the arguments are invalid, in which case error_message is set and
     *         callback is never called
     */
    bool generate(const std::string &src, const std::string &dest,
        const FileInfoCallback &callback, std::string &error_message) const;

    [[nodiscard]] static bool is_remote(const std::string &path);

private:
    using Path = std::filesystem::path;

    bool generate_from_local(const std::string &src, const std::string &dest,
        const FileInfoCallback &callback, std::string &error_message) const;
    bool generate_from_remote(const std::string &src, const std::string &dest,
        const FileInfoCallback &callback, std::string &error_message) const;
    [[nodiscard]] std::vector<Path> list_files(const Path &dir) const;
    [[nodiscard]] bool              check_file(const Path &file, const std::string &display) const;

    const std::string     object_store_dir_;
    results::ResultQueue &result_queue_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_FILEINFOGENERATOR_HPP_
