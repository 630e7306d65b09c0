#include "consolectcpsender.hpp"

namespace ircdcccli
{
ConsoleCtcpSender::ConsoleCtcpSender(std::ostream &output_stream)
    : output_stream_ {output_stream}
{}

bool ConsoleCtcpSender::send_ctcp(const std::string &nick, const std::string &payload)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[ctcp -> " << nick << "] " << payload << '\n';
    return bool(output_stream_);
}
}  // namespace ircdcccli
