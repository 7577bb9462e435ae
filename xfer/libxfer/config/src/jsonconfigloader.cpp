#include "jsonconfigloader.hpp"

#include <fstream>

#include <glog/logging.h>

namespace xfer::config
{
JSONConfigLoader::JSONConfigLoader(std::string config_file_path)
    : config_file_path_ {std::move(config_file_path)}
{}

std::map<std::string, RawConfigValue> JSONConfigLoader::load() const
{
    std::map<std::string, RawConfigValue> values;

    std::ifstream fs {config_file_path_};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open configuration file " << config_file_path_;
        return values;
    }

    auto root = nlohmann::json::parse(fs, nullptr, false);
    if (root.is_discarded())
    {
        LOG(ERROR) << "Malformed configuration file " << config_file_path_;
        return values;
    }
    if (!root.is_object())
    {
        LOG(ERROR) << "Configuration file " << config_file_path_ << " is not a JSON object";
        return values;
    }

    flatten(root, values);
    return values;
}

void JSONConfigLoader::flatten(
    const nlohmann::json &object, std::map<std::string, RawConfigValue> &out) const
{
    using value_t = nlohmann::json::value_t;

    for (const auto &[name, value] : object.items())
    {
        switch (value.type())
        {
            case value_t::object:
                flatten(value, out);
                break;
            case value_t::string:
                out[name] = value.get<std::string>();
                break;
            case value_t::boolean:
                out[name] = value.get<bool>();
                break;
            case value_t::number_integer:
            case value_t::number_unsigned:
                out[name] = value.get<long long>();
                break;
            case value_t::number_float:
                out[name] = value.get<double>();
                break;
            default:
                LOG(WARNING) << "Unsupported value type for configuration key " << name;
                break;
        }
    }
}
}  // namespace xfer::config
