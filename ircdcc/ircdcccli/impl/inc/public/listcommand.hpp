#ifndef IRCDCCCLI_LISTCOMMAND_HPP_
#define IRCDCCCLI_LISTCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class ListCommand : public ExecutableCommand
{
public:
    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_LISTCOMMAND_HPP_
