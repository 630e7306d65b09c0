#include "transferstatus.hpp"

namespace ircdcc::dcc
{
bool is_terminal(TransferStatus status)
{
    switch (status)
    {
        case TransferStatus::COMPLETED:
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
        case TransferStatus::TIMED_OUT: return true;
        default: return false;
    }
}

bool is_interrupted(TransferStatus status)
{
    return status == TransferStatus::FAILED || status == TransferStatus::CANCELLED ||
           status == TransferStatus::TIMED_OUT;
}

std::string to_string(Direction direction)
{
    return direction == Direction::SEND ? "SEND" : "RECEIVE";
}

std::string to_string(TransferStatus status)
{
    switch (status)
    {
        case TransferStatus::QUEUED: return "QUEUED";
        case TransferStatus::PENDING_ACCEPT: return "PENDING_ACCEPT";
        case TransferStatus::NEGOTIATING: return "NEGOTIATING";
        case TransferStatus::CONNECTING: return "CONNECTING";
        case TransferStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TransferStatus::PAUSED: return "PAUSED";
        case TransferStatus::PENDING_RESUME: return "PENDING_RESUME";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::FAILED: return "FAILED";
        case TransferStatus::CANCELLED: return "CANCELLED";
        case TransferStatus::TIMED_OUT: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

std::string to_string(ChecksumStatus status)
{
    switch (status)
    {
        case ChecksumStatus::PENDING: return "Pending";
        case ChecksumStatus::NOT_CHECKED: return "NotChecked";
        case ChecksumStatus::MATCH: return "Match";
        case ChecksumStatus::MISMATCH: return "Mismatch";
        case ChecksumStatus::SENDER_DID_NOT_PROVIDE: return "SenderDidNotProvide";
        case ChecksumStatus::ALGORITHM_MISMATCH: return "AlgorithmMismatch";
        case ChecksumStatus::ERROR: return "Error";
    }
    return "Unknown";
}
}  // namespace ircdcc::dcc
