#include "address.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace ircdcc::network::conversion
{
namespace
{
bool all_digits(const std::string &str)
{
    return !str.empty() &&
           std::all_of(str.cbegin(), str.cend(), [](unsigned char c) { return std::isdigit(c); });
}
}  // namespace

IPv4Address to_ipv4_address(const std::string &str)
{
    IPv4Address address = 0;
    parse_ipv4_address(str, address);
    return address;
}

std::string to_string(IPv4Address address)
{
    std::ostringstream ss;
    for (int i = 0; i != 4; ++i)
    {
        ss << ((address & 0xff000000) >> 24);
        if (i == 3)
        {
            break;
        }
        ss << '.';
        address <<= 8;
    }
    return ss.str();
}

bool parse_ipv4_address(const std::string &str, IPv4Address &address)
{
    if (all_digits(str))
    {
        if (str.size() > 10)
        {
            return false;
        }
        auto value = std::stoull(str);
        if (value > std::numeric_limits<IPv4Address>::max())
        {
            return false;
        }
        address = IPv4Address(value);
        return true;
    }

    IPv4Address result = 0;
    size_t      pos    = 0;
    for (int i = 0; i != 4; ++i)
    {
        size_t end = i == 3 ? str.size() : str.find('.', pos);
        if (end == std::string::npos)
        {
            return false;
        }

        auto octet = str.substr(pos, end - pos);
        if (!all_digits(octet) || octet.size() > 3)
        {
            return false;
        }
        auto value = std::stoul(octet);
        if (value > 255)
        {
            return false;
        }

        result = (result << 8) | IPv4Address(value);
        pos    = end + 1;
    }

    address = result;
    return true;
}
}  // namespace ircdcc::network::conversion
