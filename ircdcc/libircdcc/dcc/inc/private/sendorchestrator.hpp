#ifndef IRCDCC_DCC_SENDORCHESTRATOR_HPP_
#define IRCDCC_DCC_SENDORCHESTRATOR_HPP_

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "dccsettings.hpp"
#include "offers.hpp"
#include "sendoutcome.hpp"

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
class SendTransfer;
class Transfer;
class TransferObserver;
class TransferRegistry;

// Starts outgoing transfers. Keeps at most one active non-passive send per peer, the rest wait
// in a FIFO queue per peer.
class SendOrchestrator
{
public:
    SendOrchestrator(std::shared_ptr<TransferRegistry> registry,
        std::shared_ptr<network::CtcpSender>           ctcp_sender,
        std::shared_ptr<network::AddressResolver>      address_resolver,
        std::shared_ptr<crypto::TokenGenerator>        token_generator,
        std::shared_ptr<crypto::ChecksumCalculator>    checksum_calculator,
        std::shared_ptr<TransferObserver>              observer,
        std::shared_ptr<utils::Executer> io_executer, DCCSettings settings);

    void reconfigure(const DCCSettings &settings);

    std::vector<SendOutcome> initiate_sends(
        const std::string &peer, const std::vector<std::string> &paths, bool passive);

    // Starts the next queued file of the peer if nothing blocks it
    bool process_next_in_queue(const std::string &peer);

    // Matches an ACCEPT against the send waiting for it and lets that send connect
    bool handle_accept(const std::string &peer, const protocol::AcceptOffer &offer);

    // Re-initiates the latest interrupted send named by an id prefix or a filename
    bool resume(const std::string &identifier, SendOutcome &outcome, std::string &error);

    void                                   clear_queues();
    [[nodiscard]] std::vector<std::string> queued(const std::string &peer) const;

    // Drops what is remembered about a transfer that left the registry
    void forget(const std::string &transfer_id);

private:
    struct QueuedFile
    {
        std::string path;
        std::string filename;
        uint64_t    file_size;
        bool        passive;
    };

    // A registered transfer whose offer is sent once the orchestrator lock is released
    struct PreparedOffer
    {
        std::shared_ptr<Transfer> transfer;
        std::string               payload;
        std::string               error;
        bool                      start_mover = false;
        std::string               resumed_from;
    };

    enum class StartResult
    {
        STARTED,
        FAILED,
        NO_PORTS
    };

    bool resolve_file(
        const std::string &requested_path, QueuedFile &file, std::string &error) const;
    bool has_active_send(const std::string &peer) const;

    StartResult start_send(const std::string &peer, const QueuedFile &file, SendOutcome &outcome,
        PreparedOffer &prepared);
    StartResult start_resume(const std::string &peer, const QueuedFile &file,
        const std::shared_ptr<Transfer> &interrupted, SendOutcome &outcome,
        PreparedOffer &prepared);
    StartResult start_active(const std::string &peer, const QueuedFile &file,
        SendOutcome &outcome, PreparedOffer &prepared);
    StartResult start_passive(const std::string &peer, const QueuedFile &file,
        SendOutcome &outcome, PreparedOffer &prepared);

    // Interrupted sends of the same file that a new send can pick up from
    std::vector<std::shared_ptr<Transfer>> resume_candidates(
        const std::string &peer, const QueuedFile &file) const;

    std::shared_ptr<SendTransfer> make_transfer(
        const std::string &peer, const QueuedFile &file, uint64_t resume_offset);
    bool offer(const std::shared_ptr<Transfer> &transfer, const std::string &payload);
    void start_mover(const std::shared_ptr<Transfer> &transfer);

    // Sends the offer and starts the mover, called without holding mutex_
    bool deliver(const PreparedOffer &prepared);
    void forget_resume(const PreparedOffer &prepared);

    static std::string peer_key(const std::string &peer);

    const std::shared_ptr<TransferRegistry>           registry_;
    const std::shared_ptr<network::CtcpSender>        ctcp_sender_;
    const std::shared_ptr<network::AddressResolver>   address_resolver_;
    const std::shared_ptr<crypto::TokenGenerator>     token_generator_;
    const std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator_;
    const std::shared_ptr<TransferObserver>           observer_;
    const std::shared_ptr<utils::Executer>            io_executer_;
    DCCSettings                                       settings_;
    std::map<std::string, std::deque<QueuedFile>>     queues_;
    std::set<std::string>                             resumed_ids_;
    mutable std::mutex                                mutex_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_SENDORCHESTRATOR_HPP_
