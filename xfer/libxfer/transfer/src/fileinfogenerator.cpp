#include "fileinfogenerator.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <system_error>

#include <glog/logging.h>

#include "pathutils.hpp"

namespace xfer::transfer
{
namespace
{
namespace fs = std::filesystem;

constexpr char const *remote_scheme = "s3://";

std::string strip_scheme(const std::string &path)
{
    return path.substr(std::strlen(remote_scheme));
}

bool is_dir_like(const std::string &path)
{
    return !path.empty() && path.back() == '/';
}

// Key of a file placed under prefix
std::string join_key(const std::string &prefix, const std::string &name)
{
    if (prefix.empty() || is_dir_like(prefix))
    {
        return prefix + name;
    }
    return prefix + '/' + name;
}

// Key for a single file: a destination which looks like a directory receives the file name
std::string single_file_key(const std::string &key, const std::string &file_name)
{
    return key.empty() || is_dir_like(key) ? key + file_name : key;
}

uint64_t file_size_or_zero(const fs::path &path)
{
    std::error_code ec;
    auto            size = fs::file_size(path, ec);
    return ec ? 0 : uint64_t(size);
}
}  // namespace

FileInfoGenerator::FileInfoGenerator(
    std::string object_store_dir, results::ResultQueue &result_queue)
    : object_store_dir_ {std::move(object_store_dir)}
    , result_queue_ {result_queue}
{}

bool FileInfoGenerator::generate(const std::string &src, const std::string &dest,
    const FileInfoCallback &callback, std::string &error_message) const
{
    if (!is_remote(src) && !is_remote(dest))
    {
        error_message = "At least one of the source and destination must be an s3:// path";
        return false;
    }

    return is_remote(src) ? generate_from_remote(src, dest, callback, error_message) :
                            generate_from_local(src, dest, callback, error_message);
}

bool FileInfoGenerator::is_remote(const std::string &path)
{
    return path.rfind(remote_scheme, 0) == 0;
}

bool FileInfoGenerator::generate_from_local(const std::string &src, const std::string &dest,
    const FileInfoCallback &callback, std::string &error_message) const
{
    std::string bucket;
    std::string key;
    utils::split_bucket_key(strip_scheme(dest), bucket, key);
    if (bucket.empty())
    {
        error_message = "Invalid destination " + dest + ", a bucket name is required";
        return false;
    }

    Path src_path {src};
    if (!src_path.has_filename())
    {
        // "dir/" lists the same files as "dir"
        src_path = src_path.parent_path();
    }

    if (fs::is_directory(src_path))
    {
        for (const auto &file : list_files(src_path))
        {
            if (!check_file(file, utils::relative_path(file.string())))
            {
                continue;
            }
            callback({results::TransferType::UPLOAD, file.string(),
                bucket + '/' + join_key(key, file.lexically_relative(src_path).generic_string()),
                file_size_or_zero(file)});
        }
        return true;
    }

    if (!fs::exists(src_path))
    {
        error_message = "The user-provided path " + src + " does not exist.";
        return false;
    }

    if (check_file(src_path, utils::relative_path(src)))
    {
        callback({results::TransferType::UPLOAD, src,
            bucket + '/' + single_file_key(key, src_path.filename().string()),
            file_size_or_zero(src_path)});
    }
    return true;
}

bool FileInfoGenerator::generate_from_remote(const std::string &src, const std::string &dest,
    const FileInfoCallback &callback, std::string &error_message) const
{
    std::string bucket;
    std::string key;
    utils::split_bucket_key(strip_scheme(src), bucket, key);
    if (bucket.empty())
    {
        error_message = "Invalid source " + src + ", a bucket name is required";
        return false;
    }

    Path bucket_dir = Path {object_store_dir_} / bucket;
    if (!fs::is_directory(bucket_dir))
    {
        error_message = "The specified bucket does not exist: " + bucket;
        return false;
    }

    bool        dest_is_remote = is_remote(dest);
    std::string dest_bucket;
    std::string dest_key;
    if (dest_is_remote)
    {
        utils::split_bucket_key(strip_scheme(dest), dest_bucket, dest_key);
        if (dest_bucket.empty())
        {
            error_message = "Invalid destination " + dest + ", a bucket name is required";
            return false;
        }
    }

    auto operation =
        dest_is_remote ? results::TransferType::COPY : results::TransferType::DOWNLOAD;
    std::string prefix      = is_dir_like(key) ? key.substr(0, key.size() - 1) : key;
    Path        object_path = prefix.empty() ? bucket_dir : bucket_dir / prefix;

    if (!key.empty() && !is_dir_like(key) && fs::is_regular_file(object_path))
    {
        std::string file_name = object_path.filename().string();
        std::string dest_str;
        if (dest_is_remote)
        {
            dest_str = dest_bucket + '/' + single_file_key(dest_key, file_name);
        }
        else
        {
            dest_str = is_dir_like(dest) || fs::is_directory(dest) ?
                           (Path {dest} / file_name).string() :
                           dest;
        }

        callback({operation, bucket + '/' + key, dest_str, file_size_or_zero(object_path)});
        return true;
    }

    if (!fs::is_directory(object_path))
    {
        error_message = "No such object or prefix: " + src;
        return false;
    }

    for (const auto &file : list_files(object_path))
    {
        std::string object_key = file.lexically_relative(bucket_dir).generic_string();
        if (!check_file(file, utils::remote_uri(bucket, object_key)))
        {
            continue;
        }

        std::string rel = file.lexically_relative(object_path).generic_string();
        std::string dest_str = dest_is_remote ? dest_bucket + '/' + join_key(dest_key, rel) :
                                                (Path {dest} / rel).string();
        callback({operation, bucket + '/' + object_key, dest_str, file_size_or_zero(file)});
    }
    return true;
}

std::vector<FileInfoGenerator::Path> FileInfoGenerator::list_files(const Path &dir) const
{
    std::vector<Path> files;
    std::error_code   ec;

    for (fs::recursive_directory_iterator it {dir, fs::directory_options::skip_permission_denied,
             ec},
         end;
         !ec && it != end; it.increment(ec))
    {
        std::error_code type_ec;
        if (!it->is_directory(type_ec))
        {
            files.push_back(it->path());
        }
    }

    if (ec)
    {
        LOG(WARNING) << "Error while listing " << dir << ": " << ec.message();
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool FileInfoGenerator::check_file(const Path &file, const std::string &display) const
{
    if (!fs::is_regular_file(file))
    {
        result_queue_.push(results::make_warning(display, "File is not a regular file."));
        return false;
    }

    std::ifstream stream {file, std::ios::binary};
    if (!stream)
    {
        result_queue_.push(results::make_warning(display, "File/Directory is not readable."));
        return false;
    }

    return true;
}
}  // namespace xfer::transfer
