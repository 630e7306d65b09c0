#ifndef IRCDCC_NETWORK_ADDRESS_HPP_
#define IRCDCC_NETWORK_ADDRESS_HPP_

#include <cstdint>
#include <string>

namespace ircdcc::network
{
using IPv4Address = uint32_t;

namespace conversion
{
IPv4Address to_ipv4_address(const std::string &str);
std::string to_string(IPv4Address address);

// Accepts both a dotted quad ("192.168.0.1") and the DCC integer form ("3232235521")
bool parse_ipv4_address(const std::string &str, IPv4Address &address);
}  // namespace conversion

}  // namespace ircdcc::network

#endif  // IRCDCC_NETWORK_ADDRESS_HPP_
