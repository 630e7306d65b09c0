#ifndef IRCDCCCLI_DATASIZEFORMATTER_HPP_
#define IRCDCCCLI_DATASIZEFORMATTER_HPP_

#include <cstdint>
#include <string>

namespace ircdcccli
{
class DataSizeFormatter
{
public:
    [[nodiscard]] std::string format(
        uint64_t size, int integral_part_max_digits = 3, int fractional_part_max_digits = 3) const;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_DATASIZEFORMATTER_HPP_
