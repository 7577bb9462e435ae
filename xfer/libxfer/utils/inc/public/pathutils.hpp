#ifndef XFER_UTILS_PATHUTILS_HPP_
#define XFER_UTILS_PATHUTILS_HPP_

#include <string>

namespace xfer::utils
{
/**
 * Path of a file relative to the current working directory, or its absolute path if no
 * relative path can be computed.
 */
[[nodiscard]] std::string relative_path(const std::string &path);

// "s3://{bucket}/{key}"
[[nodiscard]] std::string remote_uri(const std::string &bucket, const std::string &key);

// Splits "bucket/key" at the first slash. The key is empty when there is no slash.
void split_bucket_key(const std::string &path, std::string &bucket, std::string &key);
}  // namespace xfer::utils

#endif  // XFER_UTILS_PATHUTILS_HPP_
