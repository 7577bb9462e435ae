#include "datasizeformatter.hpp"

#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace xfer::utils
{
namespace
{
constexpr double      unit_base = 1024.0;
constexpr char const *units[] {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
}  // namespace

std::string DataSizeFormatter::format_human_readable(uint64_t size) const
{
    if (size == 1)
    {
        return "1 Byte";
    }
    if (double(size) < unit_base)
    {
        return std::to_string(size) + " Bytes";
    }

    auto   value = double(size) / unit_base;
    size_t unit  = 0;

    // Promote once the value rounds to 1024, so 1023.9 KiB prints as 1.0 MiB
    while (std::round(value) >= unit_base && unit + 1 < std::size(units))
    {
        value /= unit_base;
        ++unit;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
    return ss.str();
}
}  // namespace xfer::utils
