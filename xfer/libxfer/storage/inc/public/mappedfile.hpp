#ifndef XFER_STORAGE_MAPPEDFILE_HPP_
#define XFER_STORAGE_MAPPEDFILE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace xfer::storage
{
/**
 * A whole file mapped into memory, either read only (open) or read-write (create).
 *
 * Empty files cannot be mapped. Both factories reject them and callers handle empty files
 * without a mapping.
 */
class MappedFile
{
public:
    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    static std::unique_ptr<MappedFile> open(const std::string &path, std::string &error_message);
    static std::unique_ptr<MappedFile> create(
        const std::string &path, uint64_t size, std::string &error_message);

    /**
     * Copies up to amount bytes starting at offset from src to the same offset of this file.
     *
     * @return number of bytes copied, 0 if this file is read only or offset is past the end of
     * either file
     */
    size_t copy_from(const MappedFile &src, uint64_t offset, size_t amount) const;

    // Writes modified pages back to the file
    bool flush();

    [[nodiscard]] const uint8_t *    data() const;
    [[nodiscard]] uint64_t           size() const;
    [[nodiscard]] bool               is_writable() const;
    [[nodiscard]] const std::string &path() const;

private:
    MappedFile(std::string path, bool writable);

    bool map(std::string &error_message);

    const std::string                  path_;
    const bool                         writable_;
    boost::interprocess::file_mapping  mapping_;
    boost::interprocess::mapped_region region_;
};
}  // namespace xfer::storage

#endif  // XFER_STORAGE_MAPPEDFILE_HPP_
