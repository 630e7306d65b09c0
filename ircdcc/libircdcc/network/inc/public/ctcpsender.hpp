#ifndef IRCDCC_NETWORK_CTCPSENDER_HPP_
#define IRCDCC_NETWORK_CTCPSENDER_HPP_

#include <string>

namespace ircdcc::network
{
// Implemented by the IRC connection layer. The payload carries no \x01 markers, wrapping it
// into a PRIVMSG is the implementer's job.
class CtcpSender
{
public:
    virtual ~CtcpSender() = default;

    virtual bool send_ctcp(const std::string &nick, const std::string &payload) = 0;
};
}  // namespace ircdcc::network

#endif  // IRCDCC_NETWORK_CTCPSENDER_HPP_
