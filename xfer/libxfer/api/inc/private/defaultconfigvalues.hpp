#ifndef XFER_API_DEFAULTCONFIGVALUES_HPP_
#define XFER_API_DEFAULTCONFIGVALUES_HPP_

#include <string>

#include "fallbackconfigvalueprovider.hpp"

namespace xfer
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    explicit DefaultConfigValues(std::string app_data_dir_path);
    [[nodiscard]] std::optional<config::ConfigValue> get(config::ConfigKey key) const override;

private:
    const std::string app_data_dir_path_;
};
}  // namespace xfer

#endif  // XFER_API_DEFAULTCONFIGVALUES_HPP_
