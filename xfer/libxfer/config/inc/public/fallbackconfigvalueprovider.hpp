#ifndef XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <optional>

#include "configkeys.hpp"
#include "configvalue.hpp"

namespace xfer::config
{
/**
 * Supplies the value of a key which is missing from the configuration source or whose
 * configured value is invalid.
 */
class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::optional<ConfigValue> get(ConfigKey key) const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
