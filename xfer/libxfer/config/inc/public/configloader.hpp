#ifndef XFER_CONFIG_CONFIGLOADER_HPP_
#define XFER_CONFIG_CONFIGLOADER_HPP_

#include <map>
#include <string>

#include "configvalue.hpp"

namespace xfer::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    // Values by key name, empty if the source cannot be read
    [[nodiscard]] virtual std::map<std::string, RawConfigValue> load() const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGLOADER_HPP_
