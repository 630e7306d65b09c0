#include "hexencoding.hpp"

#include <cctype>

namespace ircdcc::crypto
{
std::string to_hex(const uint8_t *data, size_t len)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 * len);
    for (size_t i = 0; i != len; ++i)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

bool is_hex(const std::string &str)
{
    if (str.empty())
    {
        return false;
    }
    for (char c : str)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    return true;
}
}  // namespace ircdcc::crypto
