#ifndef IRCDCC_DCC_TRANSFERSTATUS_HPP_
#define IRCDCC_DCC_TRANSFERSTATUS_HPP_

#include <string>

namespace ircdcc::dcc
{
enum class Direction
{
    SEND,
    RECEIVE
};

enum class TransferStatus
{
    QUEUED,
    PENDING_ACCEPT,
    NEGOTIATING,
    CONNECTING,
    IN_PROGRESS,
    PAUSED,
    PENDING_RESUME,
    COMPLETED,
    FAILED,
    CANCELLED,
    TIMED_OUT
};

enum class ChecksumStatus
{
    PENDING,
    NOT_CHECKED,
    MATCH,
    MISMATCH,
    SENDER_DID_NOT_PROVIDE,
    ALGORITHM_MISMATCH,
    ERROR
};

// Terminal transfers never change their status again
[[nodiscard]] bool is_terminal(TransferStatus status);

// Terminal transfers that moved some data but not all of it can be resumed
[[nodiscard]] bool is_interrupted(TransferStatus status);

std::string to_string(Direction direction);
std::string to_string(TransferStatus status);
std::string to_string(ChecksumStatus status);
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFERSTATUS_HPP_
