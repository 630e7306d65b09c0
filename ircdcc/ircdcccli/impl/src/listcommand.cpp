#include "listcommand.hpp"

#include "dccengine.hpp"

namespace ircdcccli
{
bool ListCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string & /*error_message*/) const
{
    auto lines = engine.status_lines();
    if (lines.empty())
    {
        output << "No transfers\n";
        return true;
    }
    for (const auto &line : lines)
    {
        output << line << '\n';
    }
    return true;
}

bool ListCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
