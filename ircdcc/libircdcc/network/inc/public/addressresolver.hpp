#ifndef IRCDCC_NETWORK_ADDRESSRESOLVER_HPP_
#define IRCDCC_NETWORK_ADDRESSRESOLVER_HPP_

#include <string>

namespace ircdcc::network
{
class AddressResolver
{
public:
    virtual ~AddressResolver() = default;

    // Address advertised to peers in DCC offers. A valid configured address takes precedence
    // over auto-detection.
    [[nodiscard]] virtual std::string advertised_address(const std::string &configured_address) = 0;
};
}  // namespace ircdcc::network

#endif  // IRCDCC_NETWORK_ADDRESSRESOLVER_HPP_
