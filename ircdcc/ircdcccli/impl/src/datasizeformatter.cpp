#include "datasizeformatter.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace ircdcccli
{
namespace
{
constexpr std::array<const char *, 7> byte_units {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

int count_integral_digits(double value)
{
    int digits = 1;
    while (value >= 10)
    {
        value /= 10;
        ++digits;
    }
    return digits;
}
}  // namespace

std::string DataSizeFormatter::format(
    uint64_t size, int integral_part_max_digits, int fractional_part_max_digits) const
{
    integral_part_max_digits   = std::max(integral_part_max_digits, 1);
    fractional_part_max_digits = std::max(fractional_part_max_digits, 0);

    size_t unit_magnitude = 0;
    auto   dbl_size       = double(size);
    int    integral_part_digits;

    // uint64_t tops out in the EiB range, the last unit always fits
    while ((integral_part_digits = count_integral_digits(dbl_size)) > integral_part_max_digits &&
           unit_magnitude + 1 != byte_units.size())
    {
        dbl_size /= 1024;
        ++unit_magnitude;
    }

    std::ostringstream ss;
    ss << std::setprecision(integral_part_digits + fractional_part_max_digits) << dbl_size << ' '
       << byte_units[unit_magnitude];

    return ss.str();
}
}  // namespace ircdcccli
