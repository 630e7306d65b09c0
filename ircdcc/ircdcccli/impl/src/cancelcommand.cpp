#include "cancelcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
CancelCommand::CancelCommand(std::string prefix)
    : prefix_ {std::move(prefix)}
{}

bool CancelCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    std::string message;
    if (!engine.cancel(prefix_, message))
    {
        error_message = message;
        return false;
    }
    output << message << '\n';
    return true;
}

bool CancelCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
