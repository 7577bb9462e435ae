#ifndef XFER_CONFIG_CONFIG_HPP_
#define XFER_CONFIG_CONFIG_HPP_

#include <array>
#include <cstdint>
#include <string>

#include "configkeys.hpp"
#include "configvalue.hpp"

namespace xfer::config
{
// Forward declarations
class ConfigLoader;
class FallbackConfigValueProvider;

/**
 * Resolved configuration. Every key is resolved once, at construction: the loaded value is used
 * if it has the key's type and range, otherwise the fallback value. A key without a valid value
 * from either source is a fatal error.
 */
class Config
{
public:
    Config(const ConfigLoader &config_loader,
        const FallbackConfigValueProvider &fallback_value_provider);

    [[nodiscard]] const std::string &get_string(ConfigKey key) const;
    [[nodiscard]] uint64_t           get_size(ConfigKey key) const;
    [[nodiscard]] bool               get_bool(ConfigKey key) const;

    // False if the value of key is the fallback value
    [[nodiscard]] bool is_configured(ConfigKey key) const;

private:
    template<typename T>
    [[nodiscard]] const T &get(ConfigKey key) const;

    std::array<ConfigValue, ConfigKey::KEY_COUNT> values_;
    std::array<bool, ConfigKey::KEY_COUNT>        configured_ {};
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIG_HPP_
