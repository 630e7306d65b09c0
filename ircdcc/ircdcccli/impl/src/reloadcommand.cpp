#include "reloadcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
bool ReloadCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    if (!engine.reload_config())
    {
        error_message = "Cannot reload the configuration";
        return false;
    }
    output << "Configuration reloaded\n";
    return true;
}

bool ReloadCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
