#include "commandinterpreter.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <vector>

#include "acceptcommand.hpp"
#include "cancelcommand.hpp"
#include "confirmcommand.hpp"
#include "ctcpcommand.hpp"
#include "exitcommand.hpp"
#include "getcommand.hpp"
#include "listcommand.hpp"
#include "reloadcommand.hpp"
#include "removecommand.hpp"
#include "resumecommand.hpp"
#include "sendcommand.hpp"

namespace ircdcccli
{
namespace
{
constexpr char const *send_command_name    = "send";
constexpr char const *accept_command_name  = "accept";
constexpr char const *get_command_name     = "get";
constexpr char const *confirm_command_name = "confirm";
constexpr char const *cancel_command_name  = "cancel";
constexpr char const *list_command_name    = "list";
constexpr char const *resume_command_name  = "resume";
constexpr char const *remove_command_name  = "remove";
constexpr char const *ctcp_command_name    = "ctcp";
constexpr char const *reload_command_name  = "reload";
constexpr char const *exit_command_name    = "exit";
constexpr char const *passive_flag         = "--passive";

bool parse_unsigned(const std::string &str, uint64_t max, uint64_t &value)
{
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
    {
        return false;
    }
    errno       = 0;
    char *end   = nullptr;
    auto parsed = std::strtoull(str.c_str(), &end, 10);
    if (errno == ERANGE || parsed > max)
    {
        return false;
    }
    value = parsed;
    return true;
}

std::string join(std::vector<std::string>::const_iterator begin,
    std::vector<std::string>::const_iterator              end)
{
    std::string result;
    for (auto it = begin; it != end; ++it)
    {
        if (it != begin)
        {
            result.push_back(' ');
        }
        result.append(*it);
    }
    return result;
}
}  // namespace

std::unique_ptr<ExecutableCommand> CommandInterpreter::interpret(
    const Command &command, std::string &err) const
{
    if (!command)
    {
        err = "Invalid command object";
        return nullptr;
    }

    const auto &args = command.args;

    if (command.cmd == send_command_name)
    {
        bool passive = !args.empty() && args[0] == passive_flag;
        auto first   = args.cbegin() + (passive ? 1 : 0);
        if (args.cend() - first < 2)
        {
            err = "Usage: send [--passive] {nick} {file} [file...]";
            return nullptr;
        }
        return std::make_unique<SendCommand>(
            *first, std::vector<std::string>(first + 1, args.cend()), passive);
    }
    else if (command.cmd == accept_command_name)
    {
        uint64_t port;
        uint64_t file_size;
        if (args.size() != 5 ||
            !parse_unsigned(args[3], std::numeric_limits<unsigned short>::max(), port) ||
            port == 0 ||
            !parse_unsigned(args[4], std::numeric_limits<uint64_t>::max(), file_size))
        {
            err = "Usage: accept {nick} {file} {ip} {port} {size}";
            return nullptr;
        }
        return std::make_unique<AcceptCommand>(
            args[0], args[1], args[2], static_cast<unsigned short>(port), file_size);
    }
    else if (command.cmd == get_command_name)
    {
        if (args.size() != 1)
        {
            err = "Usage: get {token}";
            return nullptr;
        }
        return std::make_unique<GetCommand>(args[0]);
    }
    else if (command.cmd == confirm_command_name)
    {
        if (args.size() != 1)
        {
            err = "Usage: confirm {transfer_id}";
            return nullptr;
        }
        return std::make_unique<ConfirmCommand>(args[0]);
    }
    else if (command.cmd == cancel_command_name)
    {
        if (args.size() != 1)
        {
            err = "Usage: cancel {transfer_id|token}";
            return nullptr;
        }
        return std::make_unique<CancelCommand>(args[0]);
    }
    else if (command.cmd == list_command_name)
    {
        if (!args.empty())
        {
            err = "Usage: list";
            return nullptr;
        }
        return std::make_unique<ListCommand>();
    }
    else if (command.cmd == resume_command_name)
    {
        if (args.size() != 1)
        {
            err = "Usage: resume {transfer_id|file}";
            return nullptr;
        }
        return std::make_unique<ResumeCommand>(args[0]);
    }
    else if (command.cmd == remove_command_name)
    {
        if (args.size() != 1)
        {
            err = "Usage: remove {transfer_id}";
            return nullptr;
        }
        return std::make_unique<RemoveCommand>(args[0]);
    }
    else if (command.cmd == ctcp_command_name)
    {
        if (args.size() < 3)
        {
            err = "Usage: ctcp {nick} {userhost} {payload...}";
            return nullptr;
        }
        return std::make_unique<CtcpCommand>(
            args[0], args[1], join(args.cbegin() + 2, args.cend()));
    }
    else if (command.cmd == reload_command_name)
    {
        if (!args.empty())
        {
            err = "Usage: reload";
            return nullptr;
        }
        return std::make_unique<ReloadCommand>();
    }
    else if (command.cmd == exit_command_name)
    {
        if (!args.empty())
        {
            err = "Usage: exit";
            return nullptr;
        }
        return std::make_unique<ExitCommand>();
    }
    else
    {
        err = "Unknown command";
        return nullptr;
    }
}

std::unique_ptr<ExecutableCommand> CommandInterpreter::make_exit_command() const
{
    return std::make_unique<ExitCommand>();
}
}  // namespace ircdcccli
