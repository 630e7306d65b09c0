#ifndef IRCDCC_DCC_TRANSFEROBSERVER_HPP_
#define IRCDCC_DCC_TRANSFEROBSERVER_HPP_

#include <cstdint>
#include <string>

#include "transferstatus.hpp"

namespace ircdcc::dcc
{
// Implementations are called from transfer movers and must return without blocking
class TransferObserver
{
public:
    virtual ~TransferObserver() = default;

    virtual void on_transfer_created(const std::string &transfer_id) = 0;
    virtual void on_transfer_queued(
        const std::string &peer, const std::string &file_path, size_t queue_position) = 0;
    virtual void on_status_changed(
        const std::string &transfer_id, TransferStatus status, const std::string &error) = 0;
    virtual void on_progress_changed(const std::string &transfer_id, uint64_t bytes_transferred,
        double rate, double eta_seconds)                                          = 0;
    virtual void on_checksum_updated(const std::string &transfer_id) = 0;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFEROBSERVER_HPP_
