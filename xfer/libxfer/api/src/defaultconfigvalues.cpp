#include "defaultconfigvalues.hpp"

#include <cstdint>
#include <filesystem>

namespace xfer
{
DefaultConfigValues::DefaultConfigValues(std::string app_data_dir_path)
    : app_data_dir_path_ {std::move(app_data_dir_path)}
{}

std::optional<config::ConfigValue> DefaultConfigValues::get(config::ConfigKey key) const
{
    using config::ConfigKey;
    using config::ConfigValue;

    switch (key)
    {
        case ConfigKey::OBJECT_STORE_DIR:
            return ConfigValue {(std::filesystem::path {app_data_dir_path_} / "objects").string()};
        case ConfigKey::MAX_CONCURRENT_REQUESTS:
            return ConfigValue {uint64_t {10}};
        case ConfigKey::MULTIPART_CHUNKSIZE:
            return ConfigValue {uint64_t {8} * 1024 * 1024};
        case ConfigKey::MAX_QUEUE_SIZE:
            return ConfigValue {uint64_t {1000}};
        case ConfigKey::QUIET:
        case ConfigKey::ONLY_SHOW_ERRORS:
            return ConfigValue {false};
        default:
            return std::nullopt;
    }
}
}  // namespace xfer
