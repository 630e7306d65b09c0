#ifndef IRCDCCCLI_CANCELCOMMAND_HPP_
#define IRCDCCCLI_CANCELCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class CancelCommand : public ExecutableCommand
{
public:
    // Matches transfer ids first, then passive offer tokens
    explicit CancelCommand(std::string prefix);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string prefix_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_CANCELCOMMAND_HPP_
