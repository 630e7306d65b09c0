#ifndef IRCDCC_DCC_RECEIVEORCHESTRATOR_HPP_
#define IRCDCC_DCC_RECEIVEORCHESTRATOR_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "dccsettings.hpp"

namespace ircdcc::crypto
{
// Forward declarations
class ChecksumCalculator;
class TokenGenerator;
}  // namespace ircdcc::crypto

namespace ircdcc::network
{
// Forward declarations
class AddressResolver;
class CtcpSender;
}  // namespace ircdcc::network

namespace ircdcc::utils
{
// Forward declarations
class Executer;
}  // namespace ircdcc::utils

namespace ircdcc::dcc
{
// Forward declarations
class ReceiveTransfer;
class Transfer;
class TransferObserver;
class TransferRegistry;

// Validates incoming offers and creates the receives that accept them. Every method returns the
// new transfer id, or an empty string with the reason in error.
class ReceiveOrchestrator
{
public:
    // An incoming active or resume offer waiting for the user to confirm it
    struct PendingOffer
    {
        std::string    peer;
        std::string    filename;
        std::string    ip;
        unsigned short port      = 0;
        uint64_t       file_size = 0;
        bool           resume    = false;
        uint64_t       position  = 0;  // Resume only
        std::string    local_path;     // Resume only, the file being completed
    };

    ReceiveOrchestrator(std::shared_ptr<TransferRegistry> registry,
        std::shared_ptr<network::CtcpSender>              ctcp_sender,
        std::shared_ptr<network::AddressResolver>         address_resolver,
        std::shared_ptr<crypto::TokenGenerator>           token_generator,
        std::shared_ptr<crypto::ChecksumCalculator>       checksum_calculator,
        std::shared_ptr<TransferObserver>                 observer,
        std::shared_ptr<utils::Executer> io_executer, DCCSettings settings);

    void reconfigure(const DCCSettings &settings);

    std::string accept_active_offer(const std::string &peer, const std::string &filename,
        const std::string &ip, unsigned short port, uint64_t file_size, std::string &error);

    std::string accept_passive_offer(const std::string &peer, const std::string &filename,
        uint64_t file_size, const std::string &token, const std::string &peer_ip,
        std::string &error);

    std::string accept_resume_offer(const std::string &peer, const std::string &filename,
        const std::string &peer_ip, unsigned short peer_port, uint64_t position,
        uint64_t total_size, const std::string &local_path, std::string &error);

    std::string register_pending_offer(const PendingOffer &offer, std::string &error);

    // Accepts a transfer previously created by register_pending_offer
    bool confirm_pending(const std::string &transfer_id, std::string &error);

private:
    bool validate_path(const std::string &peer, const std::string &filename, uint64_t file_size,
        std::string &local_path, std::string &error) const;
    bool check_resume_position(const std::string &peer, const std::string &filename,
        const std::string &local_path, uint64_t position, std::string &error) const;

    // No two live transfers may write the same file
    bool path_in_use(const std::string &local_path) const;

    std::shared_ptr<ReceiveTransfer> make_transfer(const std::string &peer,
        const std::string &filename, uint64_t file_size, const std::string &local_path,
        uint64_t resume_offset, const std::string &token);
    bool register_transfer(const std::shared_ptr<Transfer> &transfer, std::string &error);
    bool reply_resume_accept(const std::string &peer, const std::string &filename,
        unsigned short port, uint64_t position, std::string &error);
    void start_mover(const std::shared_ptr<Transfer> &transfer);

    const std::shared_ptr<TransferRegistry>           registry_;
    const std::shared_ptr<network::CtcpSender>        ctcp_sender_;
    const std::shared_ptr<network::AddressResolver>   address_resolver_;
    const std::shared_ptr<crypto::TokenGenerator>     token_generator_;
    const std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator_;
    const std::shared_ptr<TransferObserver>           observer_;
    const std::shared_ptr<utils::Executer>            io_executer_;
    DCCSettings                                       settings_;
    std::set<std::string>                             pending_resumes_;
    mutable std::mutex                                mutex_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_RECEIVEORCHESTRATOR_HPP_
