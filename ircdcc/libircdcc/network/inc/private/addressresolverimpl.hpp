#ifndef IRCDCC_NETWORK_ADDRESSRESOLVERIMPL_HPP_
#define IRCDCC_NETWORK_ADDRESSRESOLVERIMPL_HPP_

#include <boost/asio.hpp>

#include "addressresolver.hpp"

namespace ircdcc::network
{
class AddressResolverImpl : public AddressResolver
{
public:
    AddressResolverImpl();

    [[nodiscard]] std::string advertised_address(const std::string &configured_address) override;

private:
    [[nodiscard]] std::string discover_outbound_interface();
    [[nodiscard]] std::string resolve_host_name();

    boost::asio::io_context io_ctx_;
};
}  // namespace ircdcc::network

#endif  // IRCDCC_NETWORK_ADDRESSRESOLVERIMPL_HPP_
