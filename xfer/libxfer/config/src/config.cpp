#include "config.hpp"

#include <optional>

#include <glog/logging.h>

#include "configloader.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace xfer::config
{
namespace
{
std::optional<ConfigValue> validate(ConfigKey key, const RawConfigValue &raw_value)
{
    switch (key.value_type())
    {
        case ConfigValueType::STRING:
            if (const auto *str = std::get_if<std::string>(&raw_value))
            {
                return ConfigValue {*str};
            }
            break;
        case ConfigValueType::BOOL:
            if (const auto *flag = std::get_if<bool>(&raw_value))
            {
                return ConfigValue {*flag};
            }
            break;
        case ConfigValueType::SIZE:
            if (const auto *number = std::get_if<long long>(&raw_value))
            {
                if (*number < 0 || uint64_t(*number) < key.min_value())
                {
                    LOG(WARNING) << "Value " << *number << " of configuration key " << key.name()
                                 << " is below the minimum of " << key.min_value();
                    return std::nullopt;
                }
                return ConfigValue {uint64_t(*number)};
            }
            break;
    }

    LOG(WARNING) << "Wrong value type for configuration key " << key.name();
    return std::nullopt;
}

bool has_type_of(ConfigKey key, const ConfigValue &value)
{
    switch (key.value_type())
    {
        case ConfigValueType::STRING:
            return std::holds_alternative<std::string>(value);
        case ConfigValueType::SIZE:
            return std::holds_alternative<uint64_t>(value);
        case ConfigValueType::BOOL:
            return std::holds_alternative<bool>(value);
    }
    return false;
}
}  // namespace

Config::Config(
    const ConfigLoader &config_loader, const FallbackConfigValueProvider &fallback_value_provider)
{
    std::array<std::optional<ConfigValue>, ConfigKey::KEY_COUNT> loaded;
    for (const auto &[name, raw_value] : config_loader.load())
    {
        auto key = ConfigKey::from_name(name);
        if (!key)
        {
            LOG(WARNING) << "Ignoring unknown configuration key " << name;
            continue;
        }
        loaded[*key] = validate(*key, raw_value);
    }

    for (int k = 0; k != ConfigKey::KEY_COUNT; ++k)
    {
        ConfigKey key {ConfigKey::EnumType(k)};
        if (loaded[k])
        {
            values_[k]     = std::move(*loaded[k]);
            configured_[k] = true;
            continue;
        }

        auto fallback = fallback_value_provider.get(key);
        if (!fallback || !has_type_of(key, *fallback))
        {
            LOG(FATAL) << "No valid fallback value for configuration key " << key.name();
        }
        else
        {
            values_[k] = std::move(*fallback);
        }
    }
}

const std::string &Config::get_string(ConfigKey key) const
{
    return get<std::string>(key);
}

uint64_t Config::get_size(ConfigKey key) const
{
    return get<uint64_t>(key);
}

bool Config::get_bool(ConfigKey key) const
{
    return get<bool>(key);
}

bool Config::is_configured(ConfigKey key) const
{
    return configured_[key];
}

template<typename T>
const T &Config::get(ConfigKey key) const
{
    const T *value = std::get_if<T>(&values_[key]);
    if (!value)
    {
        LOG(FATAL) << "Configuration key " << key.name() << " does not hold the requested type";
    }
    return *value;
}
}  // namespace xfer::config
