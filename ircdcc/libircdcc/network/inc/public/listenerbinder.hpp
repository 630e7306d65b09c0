#ifndef IRCDCC_NETWORK_LISTENERBINDER_HPP_
#define IRCDCC_NETWORK_LISTENERBINDER_HPP_

#include <boost/asio.hpp>

namespace ircdcc::network
{
struct PortRange
{
    unsigned short first;
    unsigned short last;
};

// Opens the acceptor on the first free port of the range. The acceptor is left closed when the
// whole range is taken.
bool bind_listener(
    boost::asio::ip::tcp::acceptor &acceptor, PortRange range, unsigned short &bound_port);
}  // namespace ircdcc::network

#endif  // IRCDCC_NETWORK_LISTENERBINDER_HPP_
