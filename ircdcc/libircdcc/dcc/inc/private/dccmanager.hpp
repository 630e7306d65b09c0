#ifndef IRCDCC_DCC_DCCMANAGER_HPP_
#define IRCDCC_DCC_DCCMANAGER_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dcceventlistener.hpp"
#include "dccsettings.hpp"
#include "listenergroup.hpp"
#include "offercodec.hpp"
#include "passiveofferstore.hpp"
#include "sendoutcome.hpp"
#include "transferinfo.hpp"

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
class Timer;
}  // namespace ircdcc::utils

namespace ircdcc::dcc
{
// Forward declarations
class ReceiveOrchestrator;
class SendOrchestrator;
class TransferObserverDelegate;
class TransferRegistry;

// Entry point of the DCC core: routes incoming CTCP payloads, runs user commands and forwards
// transfer events to listeners through the event executer
class DCCManager
{
public:
    using NowFn = PassiveOfferStore::NowFn;

    DCCManager(std::shared_ptr<network::CtcpSender> ctcp_sender,
        std::shared_ptr<network::AddressResolver>   address_resolver,
        std::shared_ptr<crypto::TokenGenerator>     token_generator,
        std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator,
        std::shared_ptr<utils::Executer>            event_executer,
        std::shared_ptr<utils::Executer> io_executer, const DCCSettings &settings,
        NowFn now = PassiveOfferStore::Clock::now);

    ~DCCManager();

    DCCManager(const DCCManager &) = delete;
    DCCManager &operator=(const DCCManager &) = delete;

    bool register_listener(const std::shared_ptr<DCCEventListener> &listener);
    bool unregister_listener(const std::shared_ptr<DCCEventListener> &listener);

    void start();
    void shutdown();
    void reconfigure(const DCCSettings &settings);
    [[nodiscard]] DCCSettings settings() const;

    // Returns false when the payload was dropped
    bool dispatch_incoming_ctcp(
        const std::string &nick, const std::string &userhost, const std::string &payload);

    std::vector<SendOutcome> send(
        const std::string &peer, const std::vector<std::string> &paths, bool passive);
    std::string accept_active_offer(const std::string &peer, const std::string &filename,
        const std::string &ip, unsigned short port, uint64_t file_size, std::string &error);
    std::string accept_passive_offer(const std::string &token_prefix, std::string &error);
    bool        confirm(const std::string &id_prefix, std::string &error);
    bool        cancel(const std::string &transfer_id);

    // Tries transfer ids first, then passive offer tokens
    bool cancel_by_prefix(const std::string &prefix, std::string &message);
    bool resume(const std::string &identifier, SendOutcome &outcome, std::string &error);

    // Only terminal transfers can be removed
    bool remove(const std::string &id_prefix, std::string &error);

    [[nodiscard]] std::vector<TransferInfo>       transfers() const;
    [[nodiscard]] std::vector<PassiveOfferRecord> passive_offers() const;
    [[nodiscard]] std::vector<std::string>        status_lines() const;
    [[nodiscard]] std::vector<std::string>        queued_sends(const std::string &peer) const;

    // One pass of the periodic housekeeping, also driven by the maintenance timer
    void run_maintenance();

private:
    bool handle_send(
        const std::string &nick, const std::string &userhost, const protocol::SendOffer &offer);
    bool handle_accept(const std::string &nick, const protocol::AcceptOffer &offer);
    bool handle_resume(
        const std::string &nick, const std::string &userhost, const protocol::ResumeOffer &offer);
    bool handle_checksum(const std::string &nick, const protocol::ChecksumOffer &offer);

    // Called by transfers, never blocks the caller
    void update_created(const std::string &transfer_id);
    void update_queued(const std::string &peer, const std::string &file_path, size_t position);
    void update_status(
        const std::string &transfer_id, TransferStatus status, const std::string &error);
    void update_progress(
        const std::string &transfer_id, uint64_t bytes_transferred, double rate, double eta);
    void update_checksum(const std::string &transfer_id);

    void on_send_finished(const TransferInfo &info);
    void send_checksum(const TransferInfo &info);
    void reject_offer(const OfferInfo &offer, const std::string &reason);

    template<typename M, typename... Args>
    void post_event(M method, const Args &... args);

    const std::shared_ptr<network::CtcpSender>        ctcp_sender_;
    const std::shared_ptr<utils::Executer>            event_executer_;
    const std::shared_ptr<utils::Executer>            io_executer_;
    const NowFn                                       now_;
    const std::shared_ptr<TransferRegistry>           registry_;
    const std::shared_ptr<PassiveOfferStore>          passive_offers_;
    const std::shared_ptr<TransferObserverDelegate>   observer_;
    std::unique_ptr<SendOrchestrator>                 send_orchestrator_;
    std::unique_ptr<ReceiveOrchestrator>              receive_orchestrator_;
    std::unique_ptr<utils::Timer>                     maintenance_timer_;
    utils::ListenerGroup<DCCEventListener>            listener_group_;
    protocol::OfferCodec                              codec_;
    DCCSettings                                       settings_;
    bool                                              shut_down_;
    mutable std::mutex                                mutex_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_DCCMANAGER_HPP_
