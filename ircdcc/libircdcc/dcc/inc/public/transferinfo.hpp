#ifndef IRCDCC_DCC_TRANSFERINFO_HPP_
#define IRCDCC_DCC_TRANSFERINFO_HPP_

#include <cstdint>
#include <string>

#include "transferstatus.hpp"

namespace ircdcc::dcc
{
// Point in time copy of a transfer's state
struct TransferInfo
{
    std::string    id;
    Direction      direction = Direction::RECEIVE;
    std::string    peer;
    std::string    filename;
    std::string    local_path;
    uint64_t       file_size         = 0;
    uint64_t       bytes_transferred = 0;
    uint64_t       resume_offset     = 0;
    bool           passive           = false;
    std::string    token;
    std::string    peer_ip;
    unsigned short peer_port   = 0;
    unsigned short listen_port = 0;
    TransferStatus status      = TransferStatus::QUEUED;
    std::string    error;
    double         rate        = 0;   // Bytes per second
    double         eta_seconds = -1;  // Negative while unknown
    ChecksumStatus checksum_status = ChecksumStatus::PENDING;
    std::string    checksum_algorithm;
    std::string    expected_checksum;
    std::string    local_checksum;
};

// ID: 1a2b3c4d [RECEIVE] alice - 'f.bin' (0.50MB / 1.00MB, 50.0%) Status: IN_PROGRESS ...
std::string format_status_line(const TransferInfo &info);
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFERINFO_HPP_
