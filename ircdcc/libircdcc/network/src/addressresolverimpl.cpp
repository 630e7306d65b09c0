#include "addressresolverimpl.hpp"

#include <glog/logging.h>

#include "address.hpp"

namespace ircdcc::network
{
namespace
{
constexpr char const *   route_target_address = "8.8.8.8";
constexpr unsigned short route_target_port    = 80;
constexpr char const *   loopback             = "127.0.0.1";
}  // namespace

AddressResolverImpl::AddressResolverImpl() = default;

std::string AddressResolverImpl::advertised_address(const std::string &configured_address)
{
    if (!configured_address.empty())
    {
        IPv4Address address;
        if (conversion::parse_ipv4_address(configured_address, address))
        {
            return conversion::to_string(address);
        }
        LOG(WARNING) << "Ignoring invalid advertised address " << configured_address;
    }

    auto address = discover_outbound_interface();
    if (address.empty())
    {
        address = resolve_host_name();
    }
    if (address.empty())
    {
        LOG(WARNING) << "Cannot determine the local address, falling back to " << loopback;
        address = loopback;
    }
    return address;
}

std::string AddressResolverImpl::discover_outbound_interface()
{
    using boost::asio::ip::udp;

    // Connecting a UDP socket sends nothing, it only selects the outbound interface
    boost::system::error_code ec;
    udp::socket               socket {io_ctx_};
    socket.connect({boost::asio::ip::make_address_v4(route_target_address), route_target_port}, ec);
    if (ec)
    {
        LOG(INFO) << "Outbound interface lookup failed: " << ec.message();
        return {};
    }

    auto endpoint = socket.local_endpoint(ec);
    if (ec || !endpoint.address().is_v4() || endpoint.address().is_unspecified())
    {
        return {};
    }
    return endpoint.address().to_string();
}

std::string AddressResolverImpl::resolve_host_name()
{
    using boost::asio::ip::tcp;

    boost::system::error_code ec;
    auto                      host_name = boost::asio::ip::host_name(ec);
    if (ec)
    {
        return {};
    }

    tcp::resolver resolver {io_ctx_};
    auto          results = resolver.resolve(tcp::v4(), host_name, "", ec);
    if (ec)
    {
        LOG(INFO) << "Cannot resolve host name " << host_name << ": " << ec.message();
        return {};
    }

    for (const auto &entry : results)
    {
        auto address = entry.endpoint().address();
        if (address.is_v4() && !address.is_loopback())
        {
            return address.to_string();
        }
    }
    return {};
}
}  // namespace ircdcc::network
