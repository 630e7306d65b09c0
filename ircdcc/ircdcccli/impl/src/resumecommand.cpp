#include "resumecommand.hpp"

#include "datasizeformatter.hpp"
#include "dccengine.hpp"

namespace ircdcccli
{
ResumeCommand::ResumeCommand(std::string identifier)
    : identifier_ {std::move(identifier)}
{}

bool ResumeCommand::execute(
    ircdcc::DCCEngine &engine, std::ostream &output, std::string &error_message) const
{
    using ircdcc::dcc::SendOutcome;

    SendOutcome outcome;
    if (!engine.resume(identifier_, outcome, error_message))
    {
        return false;
    }

    if (outcome.result == SendOutcome::Result::QUEUED)
    {
        output << "Queued '" << outcome.filename << "' at position " << outcome.queue_position
               << '\n';
    }
    else
    {
        output << "Offered to resume '" << outcome.filename << "' from "
               << DataSizeFormatter {}.format(outcome.resume_offset) << " ["
               << outcome.transfer_id.substr(0, 8) << "]\n";
    }
    return true;
}

bool ResumeCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace ircdcccli
