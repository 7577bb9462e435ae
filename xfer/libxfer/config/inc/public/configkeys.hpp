#ifndef XFER_CONFIG_CONFIGKEYS_HPP_
#define XFER_CONFIG_CONFIGKEYS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace xfer::config
{
enum class ConfigValueType
{
    STRING,
    SIZE,
    BOOL
};

class ConfigKey
{
public:
    enum EnumType
    {
        OBJECT_STORE_DIR,
        MAX_CONCURRENT_REQUESTS,
        MULTIPART_CHUNKSIZE,
        MAX_QUEUE_SIZE,
        QUIET,
        ONLY_SHOW_ERRORS,

        KEY_COUNT
    };

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    static std::optional<ConfigKey> from_name(const std::string &name);

    [[nodiscard]] const char *     name() const;
    [[nodiscard]] ConfigValueType value_type() const;

    // Smallest accepted value, SIZE keys only
    [[nodiscard]] uint64_t min_value() const;

    operator EnumType() const
    {
        return key_;
    }

private:
    struct Descriptor
    {
        const char *    name;
        ConfigValueType value_type;
        uint64_t        min_value;
    };

    [[nodiscard]] const Descriptor &descriptor() const;

    static const Descriptor descriptors_[KEY_COUNT];

    EnumType key_;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGKEYS_HPP_
