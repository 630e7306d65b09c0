#ifndef IRCDCCCLI_REMOVECOMMAND_HPP_
#define IRCDCCCLI_REMOVECOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class RemoveCommand : public ExecutableCommand
{
public:
    explicit RemoveCommand(std::string id_prefix);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string id_prefix_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_REMOVECOMMAND_HPP_
