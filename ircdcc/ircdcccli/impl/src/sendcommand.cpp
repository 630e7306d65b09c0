#include "sendcommand.hpp"

#include "datasizeformatter.hpp"
#include "dccengine.hpp"

namespace ircdcccli
{
SendCommand::SendCommand(std::string peer, std::vector<std::string> paths, bool passive)
    : peer_ {std::move(peer)}
    , paths_ {std::move(paths)}
    , passive_ {passive}
{}

bool SendCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    using ircdcc::dcc::SendOutcome;

    DataSizeFormatter size_formatter;
    size_t            errors = 0;

    for (const auto &outcome : engine.send(peer_, paths_, passive_))
    {
        switch (outcome.result)
        {
            case SendOutcome::Result::STARTED:
            {
                output << "Offering '" << outcome.filename << "' ("
                       << size_formatter.format(outcome.file_size) << ") to " << peer_;
                if (outcome.resume_offset != 0)
                {
                    output << ", resuming from " << size_formatter.format(outcome.resume_offset);
                }
                if (!outcome.token.empty())
                {
                    output << ", passive token " << outcome.token;
                }
                output << " [" << outcome.transfer_id.substr(0, 8) << "]\n";
                break;
            }
            case SendOutcome::Result::QUEUED:
            {
                output << "Queued '" << outcome.filename << "' for " << peer_ << " at position "
                       << outcome.queue_position << '\n';
                break;
            }
            case SendOutcome::Result::ERROR:
            {
                output << "Cannot send " << outcome.path << ": " << outcome.error << '\n';
                ++errors;
                break;
            }
        }
    }

    if (errors == paths_.size())
    {
        error_message = "No file was sent";
        return false;
    }
    return true;
}

bool SendCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
