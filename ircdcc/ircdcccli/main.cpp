#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include <glog/logging.h>

#include "commandinterpreter.hpp"
#include "commandreader.hpp"
#include "consolectcpsender.hpp"
#include "dccengine.hpp"
#include "eventprinter.hpp"

namespace
{
constexpr char const *config_file_name          = "config.json";
constexpr int         progress_print_timeout_ms = 1000;
constexpr char const *default_configuration     = R"({
    "enabled": true,
    "download_dir": "downloads",
    "upload_dir": "uploads",
    "auto_accept": false,
    "resume_enabled": true,
    "checksum_verify": true,
    "checksum_algorithm": "md5",
    "ports": {
        "port_range_start": 1024,
        "port_range_end": 65535
    },
    "limits": {
        "max_file_size": 104857600,
        "bandwidth_limit_send_kbps": 0,
        "bandwidth_limit_recv_kbps": 0,
        "blocked_extensions": [".exe", ".bat", ".com", ".scr", ".vbs", ".pif"]
    },
    "timeouts": {
        "transfer_timeout": 300,
        "passive_token_timeout": 120
    },
    "advertised_ip": ""
}
)";

std::string get_app_data_dir()
{
    const char *home = std::getenv("HOME");
    return std::filesystem::path {home ? home : "."} / ".ircdcc";
}

bool write_file_if_not_exists(const std::string &path, const std::string &content)
{
    if (!std::filesystem::is_regular_file(path))
    {
        std::ofstream fs {path};
        if (!fs)
        {
            std::cout << "Cannot open " << path << " for writing\n";
            return false;
        }
        fs << content;
    }
    return true;
}
}  // namespace

int main(int /*argc*/, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::cout << "ircdcc command line utility " << IRCDCCCLI_VERSION << "\n\n";

    std::string app_data_dir {get_app_data_dir()};

    std::error_code ec;
    std::filesystem::create_directories(app_data_dir, ec);
    if (ec)
    {
        std::cout << "Error while creating app data directory " << app_data_dir << ": "
                  << ec.message() << "\n";
        return EXIT_FAILURE;
    }

    std::string config_file_path = std::filesystem::path {app_data_dir} / config_file_name;
    if (!write_file_if_not_exists(config_file_path, default_configuration))
    {
        return EXIT_FAILURE;
    }

    // Relative download and upload directories resolve against the app data directory
    std::filesystem::current_path(app_data_dir, ec);
    if (ec)
    {
        std::cout << "Cannot change directory to " << app_data_dir << ": " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    ircdcc::DCCEngine engine {
        config_file_path, std::make_shared<ircdcccli::ConsoleCtcpSender>(std::cout)};
    auto event_printer =
        std::make_shared<ircdcccli::EventPrinter>(std::cout, progress_print_timeout_ms);
    engine.register_listener(event_printer);

    std::cout << "Starting DCC engine...\n";
    if (!engine.start())
    {
        std::cout << "Failed to start the DCC engine, check the log file for details.\n";
        return EXIT_FAILURE;
    }
    std::cout << '\n';

    ircdcccli::CommandReader      cmd_reader {std::cin};
    ircdcccli::CommandInterpreter cmd_interpreter;

    int exit_status = EXIT_SUCCESS;

    for (;;)
    {
        std::cout << "> " << std::flush;
        ircdcccli::Command cmd = cmd_reader.read_next_command();

        std::string                                   error_message;
        std::unique_ptr<ircdcccli::ExecutableCommand> exec_cmd =
            cmd ? cmd_interpreter.interpret(cmd, error_message) :
                  cmd_interpreter.make_exit_command();
        if (!exec_cmd)
        {
            std::cout << "Invalid command: " << error_message << '\n';
            continue;
        }

        bool exec_success;
        if (!(exec_success = exec_cmd->execute(engine, std::cout, error_message)))
        {
            std::cout << error_message << '\n';
        }

        if (exec_cmd->should_terminate_program_after_execution())
        {
            if (!exec_success)
            {
                exit_status = EXIT_FAILURE;
            }
            break;
        }
    }

    return exit_status;
}
