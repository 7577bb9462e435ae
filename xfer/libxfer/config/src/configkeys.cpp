#include "configkeys.hpp"

#include <glog/logging.h>

namespace xfer::config
{
const ConfigKey::Descriptor ConfigKey::descriptors_[KEY_COUNT] {
    {"object_store_dir", ConfigValueType::STRING, 0},
    {"max_concurrent_requests", ConfigValueType::SIZE, 1},
    {"multipart_chunksize", ConfigValueType::SIZE, 1},
    {"max_queue_size", ConfigValueType::SIZE, 0},
    {"quiet", ConfigValueType::BOOL, 0},
    {"only_show_errors", ConfigValueType::BOOL, 0}};

std::optional<ConfigKey> ConfigKey::from_name(const std::string &name)
{
    for (int k = 0; k != KEY_COUNT; ++k)
    {
        if (name == descriptors_[k].name)
        {
            return ConfigKey {EnumType(k)};
        }
    }
    return std::nullopt;
}

const char *ConfigKey::name() const
{
    return descriptor().name;
}

ConfigValueType ConfigKey::value_type() const
{
    return descriptor().value_type;
}

uint64_t ConfigKey::min_value() const
{
    return descriptor().min_value;
}

const ConfigKey::Descriptor &ConfigKey::descriptor() const
{
    if (key_ < 0 || key_ >= KEY_COUNT)
    {
        LOG(FATAL) << "Invalid configuration key " << int(key_);
    }
    return descriptors_[key_];
}
}  // namespace xfer::config
