#ifndef IRCDCCCLI_RESUMECOMMAND_HPP_
#define IRCDCCCLI_RESUMECOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class ResumeCommand : public ExecutableCommand
{
public:
    // Takes a transfer id prefix or a file name
    explicit ResumeCommand(std::string identifier);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string identifier_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_RESUMECOMMAND_HPP_
