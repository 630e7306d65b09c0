#ifndef IRCDCCCLI_SENDCOMMAND_HPP_
#define IRCDCCCLI_SENDCOMMAND_HPP_

#include <string>
#include <vector>

#include "executablecommand.hpp"

namespace ircdcccli
{
class SendCommand : public ExecutableCommand
{
public:
    SendCommand(std::string peer, std::vector<std::string> paths, bool passive);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string              peer_;
    std::vector<std::string> paths_;
    bool                     passive_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_SENDCOMMAND_HPP_
