#ifndef XFER_UTILS_DATASIZEFORMATTER_HPP_
#define XFER_UTILS_DATASIZEFORMATTER_HPP_

#include <cstdint>
#include <string>

namespace xfer::utils
{
class DataSizeFormatter
{
public:
    /**
     * "1 Byte", "N Bytes" below 1 KiB, otherwise a value with exactly one decimal place in the
     * smallest binary unit that keeps it below 1024 once rounded (e.g. "5.0 MiB").
     */
    [[nodiscard]] std::string format_human_readable(uint64_t size) const;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_DATASIZEFORMATTER_HPP_
