#ifndef IRCDCCCLI_EXECUTABLECOMMAND_HPP_
#define IRCDCCCLI_EXECUTABLECOMMAND_HPP_

#include <ostream>
#include <string>

namespace ircdcc
{
// Forward declarations
class DCCEngine;
}  // namespace ircdcc

namespace ircdcccli
{
class ExecutableCommand
{
public:
    virtual ~ExecutableCommand() = default;

    [[nodiscard]] virtual bool execute(
        ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const = 0;
    [[nodiscard]] virtual bool should_terminate_program_after_execution() const         = 0;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_EXECUTABLECOMMAND_HPP_
