#ifndef IRCDCCCLI_COMMANDINTERPRETER_HPP_
#define IRCDCCCLI_COMMANDINTERPRETER_HPP_

#include <memory>
#include <string>

#include "command.hpp"
#include "executablecommand.hpp"

namespace ircdcccli
{
class CommandInterpreter
{
public:
    [[nodiscard]] std::unique_ptr<ExecutableCommand> interpret(
        const Command &command, std::string &err) const;
    [[nodiscard]] std::unique_ptr<ExecutableCommand> make_exit_command() const;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_COMMANDINTERPRETER_HPP_
