#include "pathutils.hpp"

#include <filesystem>
#include <system_error>

namespace xfer::utils
{
namespace
{
constexpr char const *remote_scheme = "s3://";
}  // namespace

std::string relative_path(const std::string &path)
{
    std::error_code ec;
    auto            rel = std::filesystem::relative(path, ec);
    if (ec || rel.empty())
    {
        auto abs = std::filesystem::absolute(path, ec);
        return ec ? path : abs.string();
    }
    return rel.string();
}

std::string remote_uri(const std::string &bucket, const std::string &key)
{
    return remote_scheme + bucket + '/' + key;
}

void split_bucket_key(const std::string &path, std::string &bucket, std::string &key)
{
    auto slash_pos = path.find('/');
    if (slash_pos == std::string::npos)
    {
        bucket = path;
        key.clear();
        return;
    }
    bucket = path.substr(0, slash_pos);
    key    = path.substr(slash_pos + 1);
}
}  // namespace xfer::utils
