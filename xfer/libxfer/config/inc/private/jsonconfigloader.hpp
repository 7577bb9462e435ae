#ifndef XFER_CONFIG_JSONCONFIGLOADER_HPP_
#define XFER_CONFIG_JSONCONFIGLOADER_HPP_

#include <nlohmann/json.hpp>

#include "configloader.hpp"

namespace xfer::config
{
/**
 * Loads configuration values from a JSON file. Sections are flattened, so
 * {"transfer": {"max_queue_size": 10}} yields the key "max_queue_size".
 */
class JSONConfigLoader : public ConfigLoader
{
public:
    explicit JSONConfigLoader(std::string config_file_path);
    [[nodiscard]] std::map<std::string, RawConfigValue> load() const override;

private:
    void flatten(const nlohmann::json &object, std::map<std::string, RawConfigValue> &out) const;

    const std::string config_file_path_;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_JSONCONFIGLOADER_HPP_
