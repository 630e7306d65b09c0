#include "dccmanager.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>
#include <glog/logging.h>

#include "ctcpsender.hpp"
#include "executer.hpp"
#include "receiveorchestrator.hpp"
#include "sendorchestrator.hpp"
#include "timer.hpp"
#include "transfer.hpp"
#include "transferobserverdelegate.hpp"
#include "transferregistry.hpp"

namespace ircdcc::dcc
{
namespace
{
constexpr auto shutdown_timeout = std::chrono::seconds {5};

OfferInfo make_offer_info(
    const std::string &nick, const std::string &userhost, const protocol::SendOffer &offer)
{
    OfferInfo info;
    info.nick      = nick;
    info.userhost  = userhost;
    info.filename  = offer.filename;
    info.file_size = offer.file_size;
    info.ip        = offer.ip;
    info.port      = offer.port;
    info.passive   = offer.is_passive();
    info.token     = offer.token;
    return info;
}

std::string seconds_string(std::chrono::seconds duration)
{
    return std::to_string(duration.count()) + "s";
}
}  // namespace

template<typename M, typename... Args>
void DCCManager::post_event(M method, const Args &... args)
{
    event_executer_->add_job(
        [this, method, args...](const utils::CompletionToken & /*completion_token*/) {
            listener_group_.notify(method, args...);
        });
}

DCCManager::DCCManager(std::shared_ptr<network::CtcpSender> ctcp_sender,
    std::shared_ptr<network::AddressResolver>                address_resolver,
    std::shared_ptr<crypto::TokenGenerator>                  token_generator,
    std::shared_ptr<crypto::ChecksumCalculator>              checksum_calculator,
    std::shared_ptr<utils::Executer>                         event_executer,
    std::shared_ptr<utils::Executer> io_executer, const DCCSettings &settings, NowFn now)
    : ctcp_sender_ {std::move(ctcp_sender)}
    , event_executer_ {std::move(event_executer)}
    , io_executer_ {std::move(io_executer)}
    , now_ {std::move(now)}
    , registry_ {std::make_shared<TransferRegistry>()}
    , passive_offers_ {std::make_shared<PassiveOfferStore>(now_)}
    , observer_ {std::make_shared<TransferObserverDelegate>()}
    , settings_ {settings}
    , shut_down_ {false}
{
    observer_->set_on_transfer_created_cb(
        [this](const std::string &transfer_id) { update_created(transfer_id); });
    observer_->set_on_transfer_queued_cb(
        [this](const std::string &peer, const std::string &file_path, size_t position) {
            update_queued(peer, file_path, position);
        });
    observer_->set_on_status_changed_cb(
        [this](const std::string &transfer_id, TransferStatus status, const std::string &error) {
            update_status(transfer_id, status, error);
        });
    observer_->set_on_progress_changed_cb(
        [this](const std::string &transfer_id, uint64_t bytes, double rate, double eta) {
            update_progress(transfer_id, bytes, rate, eta);
        });
    observer_->set_on_checksum_updated_cb(
        [this](const std::string &transfer_id) { update_checksum(transfer_id); });

    send_orchestrator_ = std::make_unique<SendOrchestrator>(registry_, ctcp_sender_,
        address_resolver, token_generator, checksum_calculator, observer_, io_executer_, settings);
    receive_orchestrator_ = std::make_unique<ReceiveOrchestrator>(registry_, ctcp_sender_,
        address_resolver, token_generator, checksum_calculator, observer_, io_executer_, settings);
    maintenance_timer_ = std::make_unique<utils::Timer>(io_executer_);
}

DCCManager::~DCCManager()
{
    shutdown();
    // Movers that missed the shutdown deadline still hold the observer
    observer_->clear_callbacks();
    event_executer_->process_all_jobs();
}

bool DCCManager::register_listener(const std::shared_ptr<DCCEventListener> &listener)
{
    return listener_group_.add(listener);
}

bool DCCManager::unregister_listener(const std::shared_ptr<DCCEventListener> &listener)
{
    return listener_group_.remove(listener);
}

void DCCManager::start()
{
    auto period = std::chrono::duration_cast<utils::Timer::Period>(settings().maintenance_period);
    if (maintenance_timer_->start(period, [this] { run_maintenance(); }))
    {
        LOG(INFO) << "DCC maintenance runs every "
                  << std::chrono::duration_cast<std::chrono::seconds>(period).count() << "s";
    }
}

void DCCManager::shutdown()
{
    {
        std::lock_guard lock {mutex_};
        if (shut_down_)
        {
            return;
        }
        shut_down_ = true;
    }

    LOG(INFO) << "Shutting down DCC";

    if (maintenance_timer_->is_running())
    {
        maintenance_timer_->stop();
    }
    send_orchestrator_->clear_queues();

    auto transfers = registry_->all();
    for (const auto &transfer : transfers)
    {
        transfer->cancel();
    }

    auto deadline = std::chrono::steady_clock::now() + shutdown_timeout;
    for (const auto &transfer : transfers)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!transfer->wait_for_mover(std::max(remaining, std::chrono::milliseconds {0})))
        {
            LOG(WARNING) << "Transfer " << transfer->id() << " did not stop in time";
        }
    }
}

void DCCManager::reconfigure(const DCCSettings &settings)
{
    std::chrono::seconds old_period;
    {
        std::lock_guard lock {mutex_};
        old_period = settings_.maintenance_period;
        settings_  = settings;
    }

    send_orchestrator_->reconfigure(settings);
    receive_orchestrator_->reconfigure(settings);

    if (old_period != settings.maintenance_period && maintenance_timer_->is_running())
    {
        maintenance_timer_->restart(
            std::chrono::duration_cast<utils::Timer::Period>(settings.maintenance_period));
    }
    LOG(INFO) << "DCC settings reloaded";
}

DCCSettings DCCManager::settings() const
{
    std::lock_guard lock {mutex_};
    return settings_;
}

bool DCCManager::dispatch_incoming_ctcp(
    const std::string &nick, const std::string &userhost, const std::string &payload)
{
    {
        std::lock_guard lock {mutex_};
        if (shut_down_ || !settings_.enabled)
        {
            LOG(INFO) << "DCC is disabled, ignoring payload from " << nick;
            return false;
        }
    }

    protocol::Offer offer;
    std::string     error;
    if (!codec_.parse(payload, offer, error))
    {
        LOG(WARNING) << "Dropping malformed DCC payload from " << nick << ": " << error;
        return false;
    }

    if (auto send = std::get_if<protocol::SendOffer>(&offer))
    {
        return handle_send(nick, userhost, *send);
    }
    if (auto accept = std::get_if<protocol::AcceptOffer>(&offer))
    {
        return handle_accept(nick, *accept);
    }
    if (auto resume = std::get_if<protocol::ResumeOffer>(&offer))
    {
        return handle_resume(nick, userhost, *resume);
    }
    return handle_checksum(nick, std::get<protocol::ChecksumOffer>(offer));
}

std::vector<SendOutcome> DCCManager::send(
    const std::string &peer, const std::vector<std::string> &paths, bool passive)
{
    {
        std::lock_guard lock {mutex_};
        if (shut_down_ || !settings_.enabled)
        {
            std::vector<SendOutcome> outcomes(paths.size());
            for (size_t i = 0; i != paths.size(); ++i)
            {
                outcomes[i].path  = paths[i];
                outcomes[i].error = "DCC is disabled";
            }
            return outcomes;
        }
    }
    return send_orchestrator_->initiate_sends(peer, paths, passive);
}

std::string DCCManager::accept_active_offer(const std::string &peer, const std::string &filename,
    const std::string &ip, unsigned short port, uint64_t file_size, std::string &error)
{
    return receive_orchestrator_->accept_active_offer(peer, filename, ip, port, file_size, error);
}

std::string DCCManager::accept_passive_offer(const std::string &token_prefix, std::string &error)
{
    PassiveOfferRecord record;
    switch (passive_offers_->find_by_prefix(token_prefix, record))
    {
        case PrefixMatch::NOT_FOUND:
            error = "No passive offer matches token '" + token_prefix + "'";
            return {};
        case PrefixMatch::AMBIGUOUS:
            error = "Token '" + token_prefix + "' matches more than one passive offer";
            return {};
        case PrefixMatch::FOUND: break;
    }

    auto transfer_id = receive_orchestrator_->accept_passive_offer(
        record.nick, record.filename, record.file_size, record.token, record.ip, error);
    if (!transfer_id.empty())
    {
        passive_offers_->remove(record.token);
    }
    return transfer_id;
}

bool DCCManager::confirm(const std::string &id_prefix, std::string &error)
{
    std::shared_ptr<Transfer> transfer;
    switch (registry_->find_by_prefix(id_prefix, transfer))
    {
        case PrefixMatch::NOT_FOUND:
            error = "No transfer matches '" + id_prefix + "'";
            return false;
        case PrefixMatch::AMBIGUOUS:
            error = "'" + id_prefix + "' matches more than one transfer";
            return false;
        case PrefixMatch::FOUND: break;
    }
    return receive_orchestrator_->confirm_pending(transfer->id(), error);
}

bool DCCManager::cancel(const std::string &transfer_id)
{
    auto transfer = registry_->get(transfer_id);
    if (!transfer)
    {
        return false;
    }
    return transfer->cancel();
}

bool DCCManager::cancel_by_prefix(const std::string &prefix, std::string &message)
{
    std::shared_ptr<Transfer> transfer;
    switch (registry_->find_by_prefix(prefix, transfer))
    {
        case PrefixMatch::FOUND:
            if (!transfer->cancel())
            {
                message = "Transfer " + transfer->id() + " is already " +
                          to_string(transfer->status());
                return false;
            }
            message = "Cancelled transfer " + transfer->id() + " of '" + transfer->filename() +
                      "' with " + transfer->peer();
            return true;
        case PrefixMatch::AMBIGUOUS:
            message = "'" + prefix + "' matches more than one transfer";
            return false;
        case PrefixMatch::NOT_FOUND: break;
    }

    PassiveOfferRecord record;
    switch (passive_offers_->cancel_by_prefix(prefix, record))
    {
        case PrefixMatch::FOUND:
            message = "Cancelled passive offer " + record.token + " of '" + record.filename +
                      "' from " + record.nick;
            return true;
        case PrefixMatch::AMBIGUOUS:
            message = "'" + prefix + "' matches more than one passive offer";
            return false;
        case PrefixMatch::NOT_FOUND: break;
    }

    message = "No transfer or passive offer matches '" + prefix + "'";
    return false;
}

bool DCCManager::resume(const std::string &identifier, SendOutcome &outcome, std::string &error)
{
    return send_orchestrator_->resume(identifier, outcome, error);
}

bool DCCManager::remove(const std::string &id_prefix, std::string &error)
{
    std::shared_ptr<Transfer> transfer;
    switch (registry_->find_by_prefix(id_prefix, transfer))
    {
        case PrefixMatch::NOT_FOUND:
            error = "No transfer matches '" + id_prefix + "'";
            return false;
        case PrefixMatch::AMBIGUOUS:
            error = "'" + id_prefix + "' matches more than one transfer";
            return false;
        case PrefixMatch::FOUND: break;
    }

    if (!is_terminal(transfer->status()))
    {
        error = "Transfer " + transfer->id() + " is " + to_string(transfer->status()) +
                ", cancel it first";
        return false;
    }
    send_orchestrator_->forget(transfer->id());
    return registry_->remove(transfer->id());
}

std::vector<TransferInfo> DCCManager::transfers() const
{
    std::vector<TransferInfo> infos;
    for (const auto &transfer : registry_->all())
    {
        infos.push_back(transfer->info());
    }
    return infos;
}

std::vector<PassiveOfferRecord> DCCManager::passive_offers() const
{
    return passive_offers_->list();
}

std::vector<std::string> DCCManager::status_lines() const
{
    std::vector<std::string> lines;
    for (const auto &info : transfers())
    {
        lines.push_back(format_status_line(info));
    }
    auto offer_lines = passive_offers_->status_lines();
    lines.insert(lines.end(), offer_lines.begin(), offer_lines.end());
    return lines;
}

std::vector<std::string> DCCManager::queued_sends(const std::string &peer) const
{
    return send_orchestrator_->queued(peer);
}

void DCCManager::run_maintenance()
{
    auto settings = this->settings();
    auto now      = now_();

    auto evicted = passive_offers_->evict_stale(settings.passive_token_timeout);
    if (evicted != 0)
    {
        LOG(INFO) << "Evicted " << evicted << " stale passive offer(s)";
    }

    for (const auto &transfer : registry_->all())
    {
        auto status = transfer->status();
        auto age    = now - transfer->status_changed_at();

        // Transfers without a mover have nothing else bounding their wait
        bool waiting =
            status == TransferStatus::PENDING_ACCEPT ||
            (status == TransferStatus::NEGOTIATING && transfer->direction() == Direction::SEND &&
                transfer->passive());
        if (waiting && !transfer->mover_running() && age > settings.transfer_timeout)
        {
            transfer->expire("No response from " + transfer->peer() + " within " +
                             seconds_string(settings.transfer_timeout));
            continue;
        }

        if (settings.cleanup_enabled && is_terminal(status) && !transfer->mover_running() &&
            age > settings.transfer_max_age)
        {
            LOG(INFO) << "Removing old transfer " << transfer->id() << " ("
                      << transfer->filename() << ")";
            send_orchestrator_->forget(transfer->id());
            registry_->remove(transfer->id());
        }
    }
}

bool DCCManager::handle_send(
    const std::string &nick, const std::string &userhost, const protocol::SendOffer &offer)
{
    auto settings = this->settings();
    auto info     = make_offer_info(nick, userhost, offer);

    if (offer.is_passive())
    {
        passive_offers_->store(
            offer.token, nick, offer.filename, offer.file_size, offer.ip, userhost);
        passive_offers_->evict_stale(settings.passive_token_timeout);
        post_event(&DCCEventListener::on_offer_received, info);

        if (!settings.auto_accept)
        {
            return true;
        }

        std::string error;
        if (receive_orchestrator_
                ->accept_passive_offer(
                    nick, offer.filename, offer.file_size, offer.token, offer.ip, error)
                .empty())
        {
            reject_offer(info, error);
            return false;
        }
        passive_offers_->remove(offer.token);
        return true;
    }

    std::string error;
    if (settings.auto_accept)
    {
        info.transfer_id = receive_orchestrator_->accept_active_offer(
            nick, offer.filename, offer.ip, offer.port, offer.file_size, error);
    }
    else
    {
        ReceiveOrchestrator::PendingOffer pending;
        pending.peer      = nick;
        pending.filename  = offer.filename;
        pending.ip        = offer.ip;
        pending.port      = offer.port;
        pending.file_size = offer.file_size;
        info.transfer_id  = receive_orchestrator_->register_pending_offer(pending, error);
    }

    if (info.transfer_id.empty())
    {
        reject_offer(info, error);
        return false;
    }
    post_event(&DCCEventListener::on_offer_received, info);
    return true;
}

bool DCCManager::handle_accept(const std::string &nick, const protocol::AcceptOffer &offer)
{
    return send_orchestrator_->handle_accept(nick, offer);
}

bool DCCManager::handle_resume(
    const std::string &nick, const std::string &userhost, const protocol::ResumeOffer &offer)
{
    auto settings = this->settings();

    OfferInfo info;
    info.nick     = nick;
    info.userhost = userhost;
    info.filename = offer.filename;
    info.port     = offer.port;
    info.resume   = true;
    info.position = offer.position;
    info.token    = offer.token;

    if (!settings.resume_enabled)
    {
        reject_offer(info, "Resuming transfers is disabled");
        return false;
    }

    auto interrupted = registry_->find_latest([&](const Transfer &t) {
        return t.direction() == Direction::RECEIVE && boost::algorithm::iequals(t.peer(), nick) &&
               t.filename() == offer.filename && is_interrupted(t.status());
    });
    if (!interrupted)
    {
        reject_offer(info, "No interrupted receive of '" + offer.filename + "' from " + nick);
        return false;
    }

    auto previous  = interrupted->info();
    info.ip        = previous.peer_ip;
    info.file_size = previous.file_size;
    if (previous.peer_ip.empty())
    {
        reject_offer(info, "The address of " + nick + " is unknown");
        return false;
    }

    std::string error;
    if (settings.auto_accept)
    {
        info.transfer_id = receive_orchestrator_->accept_resume_offer(nick, offer.filename,
            previous.peer_ip, offer.port, offer.position, previous.file_size,
            previous.local_path, error);
    }
    else
    {
        ReceiveOrchestrator::PendingOffer pending;
        pending.peer       = nick;
        pending.filename   = offer.filename;
        pending.ip         = previous.peer_ip;
        pending.port       = offer.port;
        pending.file_size  = previous.file_size;
        pending.resume     = true;
        pending.position   = offer.position;
        pending.local_path = previous.local_path;
        info.transfer_id   = receive_orchestrator_->register_pending_offer(pending, error);
    }

    if (info.transfer_id.empty())
    {
        reject_offer(info, error);
        return false;
    }
    post_event(&DCCEventListener::on_offer_received, info);
    return true;
}

bool DCCManager::handle_checksum(const std::string &nick, const protocol::ChecksumOffer &offer)
{
    auto is_candidate = [&](const Transfer &t) {
        return t.direction() == Direction::RECEIVE && boost::algorithm::iequals(t.peer(), nick);
    };

    auto transfer = registry_->get(offer.transfer_id);
    if (!transfer || !is_candidate(*transfer))
    {
        transfer = registry_->find_latest([&](const Transfer &t) {
            return is_candidate(t) && t.filename() == offer.filename;
        });
    }
    if (!transfer)
    {
        LOG(WARNING) << "DCCCHECKSUM from " << nick << " for '" << offer.filename
                     << "' matches no receive";
        return false;
    }

    LOG(INFO) << "Received " << offer.algorithm << " checksum of '" << offer.filename << "' from "
              << nick;
    transfer->set_expected_checksum(offer.algorithm, offer.value);
    return true;
}

void DCCManager::update_created(const std::string &transfer_id)
{
    auto transfer = registry_->get(transfer_id);
    if (transfer)
    {
        post_event(&DCCEventListener::on_transfer_created, transfer->info());
    }
}

void DCCManager::update_queued(
    const std::string &peer, const std::string &file_path, size_t position)
{
    post_event(&DCCEventListener::on_send_queued, peer, file_path, position);
}

void DCCManager::update_status(
    const std::string &transfer_id, TransferStatus status, const std::string &error)
{
    auto transfer = registry_->get(transfer_id);
    if (!transfer)
    {
        return;
    }

    auto info   = transfer->info();
    info.status = status;
    info.error  = error;
    event_executer_->add_job([this, info](const utils::CompletionToken & /*completion_token*/) {
        listener_group_.notify(&DCCEventListener::on_status_changed, info);
        if (info.direction == Direction::SEND && is_terminal(info.status))
        {
            on_send_finished(info);
        }
    });
}

void DCCManager::update_progress(
    const std::string &transfer_id, uint64_t bytes_transferred, double rate, double eta)
{
    auto transfer = registry_->get(transfer_id);
    if (!transfer)
    {
        return;
    }

    auto info              = transfer->info();
    info.bytes_transferred = bytes_transferred;
    info.rate              = rate;
    info.eta_seconds       = eta;
    post_event(&DCCEventListener::on_progress_changed, info);
}

void DCCManager::update_checksum(const std::string &transfer_id)
{
    auto transfer = registry_->get(transfer_id);
    if (!transfer)
    {
        return;
    }

    auto info = transfer->info();
    event_executer_->add_job([this, info](const utils::CompletionToken & /*completion_token*/) {
        listener_group_.notify(&DCCEventListener::on_checksum_updated, info);
        if (info.direction == Direction::SEND && info.status == TransferStatus::COMPLETED &&
            !info.local_checksum.empty())
        {
            send_checksum(info);
        }
    });
}

void DCCManager::on_send_finished(const TransferInfo &info)
{
    if (send_orchestrator_->process_next_in_queue(info.peer))
    {
        LOG(INFO) << "Started the next queued send to " << info.peer;
    }
}

void DCCManager::send_checksum(const TransferInfo &info)
{
    protocol::ChecksumOffer checksum {
        info.id, info.filename, info.checksum_algorithm, info.local_checksum};
    if (!ctcp_sender_->send_ctcp(info.peer, codec_.format(checksum)))
    {
        LOG(WARNING) << "Cannot send the checksum of '" << info.filename << "' to " << info.peer;
        return;
    }
    LOG(INFO) << "Sent " << info.checksum_algorithm << " checksum of '" << info.filename
              << "' to " << info.peer;
}

void DCCManager::reject_offer(const OfferInfo &offer, const std::string &reason)
{
    LOG(WARNING) << "Rejected DCC offer of '" << offer.filename << "' from " << offer.nick << ": "
                 << reason;
    post_event(&DCCEventListener::on_offer_rejected, offer, reason);
}
}  // namespace ircdcc::dcc
