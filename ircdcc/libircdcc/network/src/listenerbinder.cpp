#include "listenerbinder.hpp"

#include <glog/logging.h>

namespace ircdcc::network
{
bool bind_listener(
    boost::asio::ip::tcp::acceptor &acceptor, PortRange range, unsigned short &bound_port)
{
    using boost::asio::ip::tcp;

    if (range.first == 0 || range.first > range.last)
    {
        LOG(ERROR) << "Invalid port range " << range.first << "-" << range.last;
        return false;
    }

    for (unsigned port = range.first; port <= range.last; ++port)
    {
        boost::system::error_code ec;

        if (acceptor.is_open())
        {
            acceptor.close(ec);
        }

        acceptor.open(tcp::v4(), ec);
        if (ec)
        {
            LOG(ERROR) << "Cannot open listening socket: " << ec.message();
            return false;
        }

        acceptor.bind({tcp::v4(), static_cast<unsigned short>(port)}, ec);
        if (!ec)
        {
            acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
        }
        if (!ec)
        {
            bound_port = static_cast<unsigned short>(port);
            return true;
        }
    }

    boost::system::error_code ec;
    acceptor.close(ec);
    LOG(WARNING) << "No available ports in range " << range.first << "-" << range.last;
    return false;
}
}  // namespace ircdcc::network
