#ifndef IRCDCCCLI_COMMAND_HPP_
#define IRCDCCCLI_COMMAND_HPP_

#include <string>
#include <type_traits>
#include <vector>

namespace ircdcccli
{
struct Command
{
    Command() = default;

    explicit Command(std::string _cmd)
        : cmd {std::move(_cmd)}
    {}

    template<typename ArgsIt,
        typename = std::enable_if_t<std::is_convertible_v<decltype(*ArgsIt {}), std::string>>>
    Command(std::string _cmd, ArgsIt args_begin, ArgsIt args_end)
        : cmd {std::move(_cmd)}
        , args(args_begin, args_end)
    {}

    [[nodiscard]] bool valid() const
    {
        return !cmd.empty();
    }

    explicit operator bool() const
    {
        return valid();
    }

    std::string              cmd;
    std::vector<std::string> args;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_COMMAND_HPP_
