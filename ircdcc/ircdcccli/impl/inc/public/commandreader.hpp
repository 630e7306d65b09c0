#ifndef IRCDCCCLI_COMMANDREADER_HPP_
#define IRCDCCCLI_COMMANDREADER_HPP_

#include <istream>
#include <string>
#include <vector>

#include "command.hpp"

namespace ircdcccli
{
// Splits input lines on whitespace. Double quoted arguments may contain spaces, a backslash
// escapes the next character inside quotes and an unterminated quote runs to the end of the line.
class CommandReader
{
public:
    explicit CommandReader(std::istream &input);

    // Returns an invalid command at end of input
    [[nodiscard]] Command read_next_command() const;

    [[nodiscard]] static std::vector<std::string> split(const std::string &line);

private:
    std::istream &input_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_COMMANDREADER_HPP_
