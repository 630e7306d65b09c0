#include "getcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
GetCommand::GetCommand(std::string token_prefix)
    : token_prefix_ {std::move(token_prefix)}
{}

bool GetCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    auto id = engine.accept_passive_offer(token_prefix_, error_message);
    if (id.empty())
    {
        return false;
    }
    output << "Accepted passive offer, waiting for the sender to connect [" << id.substr(0, 8)
           << "]\n";
    return true;
}

bool GetCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
