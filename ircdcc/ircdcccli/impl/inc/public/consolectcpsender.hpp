#ifndef IRCDCCCLI_CONSOLECTCPSENDER_HPP_
#define IRCDCCCLI_CONSOLECTCPSENDER_HPP_

#include <mutex>
#include <ostream>
#include <string>

#include "ctcpsender.hpp"

namespace ircdcccli
{
// Stands in for an IRC connection: outbound payloads are printed so that they can be pasted into
// another instance with the ctcp command
class ConsoleCtcpSender : public ircdcc::network::CtcpSender
{
public:
    explicit ConsoleCtcpSender(std::ostream &output_stream);

    bool send_ctcp(const std::string &nick, const std::string &payload) override;

private:
    std::ostream &output_stream_;
    std::mutex    mutex_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_CONSOLECTCPSENDER_HPP_
