#ifndef IRCDCCCLI_CTCPCOMMAND_HPP_
#define IRCDCCCLI_CTCPCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class CtcpCommand : public ExecutableCommand
{
public:
    // Feeds a payload to the engine as if it came from the IRC connection
    CtcpCommand(std::string nick, std::string userhost, std::string payload);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string nick_;
    std::string userhost_;
    std::string payload_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_CTCPCOMMAND_HPP_
