#ifndef IRCDCCCLI_GETCOMMAND_HPP_
#define IRCDCCCLI_GETCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class GetCommand : public ExecutableCommand
{
public:
    explicit GetCommand(std::string token_prefix);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string token_prefix_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_GETCOMMAND_HPP_
