#include "removecommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
RemoveCommand::RemoveCommand(std::string id_prefix)
    : id_prefix_ {std::move(id_prefix)}
{}

bool RemoveCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    if (!engine.remove(id_prefix_, error_message))
    {
        return false;
    }
    output << "Transfer removed\n";
    return true;
}

bool RemoveCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
