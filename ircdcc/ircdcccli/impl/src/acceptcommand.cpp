#include "acceptcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
AcceptCommand::AcceptCommand(std::string peer, std::string filename, std::string ip,
    unsigned short port, uint64_t file_size)
    : peer_ {std::move(peer)}
    , filename_ {std::move(filename)}
    , ip_ {std::move(ip)}
    , port_ {port}
    , file_size_ {file_size}
{}

bool AcceptCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    auto id = engine.accept_active_offer(peer_, filename_, ip_, port_, file_size_, error_message);
    if (id.empty())
    {
        return false;
    }
    output << "Receiving '" << filename_ << "' from " << peer_ << " [" << id.substr(0, 8)
           << "]\n";
    return true;
}

bool AcceptCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
