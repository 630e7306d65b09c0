#include "ctcpcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
CtcpCommand::CtcpCommand(std::string nick, std::string userhost, std::string payload)
    : nick_ {std::move(nick)}
    , userhost_ {std::move(userhost)}
    , payload_ {std::move(payload)}
{}

bool CtcpCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream & /*output*/, std::string &error_message) const
{
    if (!engine.dispatch_incoming_ctcp(nick_, userhost_, payload_))
    {
        error_message = "Payload was not accepted, check the log file for details";
        return false;
    }
    return true;
}

bool CtcpCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
