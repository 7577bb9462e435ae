#ifndef XFER_CONFIG_CONFIGVALUE_HPP_
#define XFER_CONFIG_CONFIGVALUE_HPP_

#include <cstdint>
#include <string>
#include <variant>

namespace xfer::config
{
// Value of a key after validation, the alternative matches the key's ConfigValueType
using ConfigValue = std::variant<std::string, uint64_t, bool>;

// Value as read from a configuration source, not yet checked against a key
using RawConfigValue = std::variant<std::string, long long, double, bool>;
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGVALUE_HPP_
