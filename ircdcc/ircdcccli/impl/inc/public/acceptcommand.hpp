#ifndef IRCDCCCLI_ACCEPTCOMMAND_HPP_
#define IRCDCCCLI_ACCEPTCOMMAND_HPP_

#include <cstdint>
#include <string>

#include "executablecommand.hpp"

namespace ircdcccli
{
class AcceptCommand : public ExecutableCommand
{
public:
    AcceptCommand(std::string peer, std::string filename, std::string ip, unsigned short port,
        uint64_t file_size);

    [[nodiscard]] bool execute(ircdcc::DCCEngine &engine, std::ostream &output,
        std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string    peer_;
    std::string    filename_;
    std::string    ip_;
    unsigned short port_;
    uint64_t       file_size_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_ACCEPTCOMMAND_HPP_
