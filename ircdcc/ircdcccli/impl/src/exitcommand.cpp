#include "exitcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
bool ExitCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    output << "\nStopping DCC engine...\n";
    bool status = engine.stop();
    if (!status)
    {
        error_message = "Internal error: engine was not running";
    }
    return status;
}

bool ExitCommand::should_terminate_program_after_execution() const
{
    return true;
}
}  // namespace ircdcccli
