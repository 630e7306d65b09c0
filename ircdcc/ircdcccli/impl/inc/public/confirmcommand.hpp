#ifndef IRCDCCCLI_CONFIRMCOMMAND_HPP_
#define IRCDCCCLI_CONFIRMCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class ConfirmCommand : public ExecutableCommand
{
public:
    explicit ConfirmCommand(std::string id_prefix);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string id_prefix_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_CONFIRMCOMMAND_HPP_
