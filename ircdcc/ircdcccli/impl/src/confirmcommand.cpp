#include "confirmcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
ConfirmCommand::ConfirmCommand(std::string id_prefix)
    : id_prefix_ {std::move(id_prefix)}
{}

bool ConfirmCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    if (!engine.confirm(id_prefix_, error_message))
    {
        return false;
    }
    output << "Offer accepted\n";
    return true;
}

bool ConfirmCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
