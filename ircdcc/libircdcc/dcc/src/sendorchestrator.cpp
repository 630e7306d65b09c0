#include "sendorchestrator.hpp"

#include <filesystem>

#include <boost/algorithm/string.hpp>
#include <glog/logging.h>

#include "addressresolver.hpp"
#include "ctcpsender.hpp"
#include "executer.hpp"
#include "offercodec.hpp"
#include "sendtransfer.hpp"
#include "tokengenerator.hpp"
#include "transferobserver.hpp"
#include "transferregistry.hpp"

namespace ircdcc::dcc
{
namespace
{
constexpr size_t transfer_id_bytes = 16;
constexpr size_t token_bytes       = 8;
}  // namespace

SendOrchestrator::SendOrchestrator(std::shared_ptr<TransferRegistry> registry,
    std::shared_ptr<network::CtcpSender>                             ctcp_sender,
    std::shared_ptr<network::AddressResolver>                        address_resolver,
    std::shared_ptr<crypto::TokenGenerator>                          token_generator,
    std::shared_ptr<crypto::ChecksumCalculator>                      checksum_calculator,
    std::shared_ptr<TransferObserver>                                observer,
    std::shared_ptr<utils::Executer> io_executer, DCCSettings settings)
    : registry_ {std::move(registry)}
    , ctcp_sender_ {std::move(ctcp_sender)}
    , address_resolver_ {std::move(address_resolver)}
    , token_generator_ {std::move(token_generator)}
    , checksum_calculator_ {std::move(checksum_calculator)}
    , observer_ {std::move(observer)}
    , io_executer_ {std::move(io_executer)}
    , settings_ {std::move(settings)}
{}

void SendOrchestrator::reconfigure(const DCCSettings &settings)
{
    std::lock_guard lock {mutex_};
    settings_ = settings;
}

std::vector<SendOutcome> SendOrchestrator::initiate_sends(
    const std::string &peer, const std::vector<std::string> &paths, bool passive)
{
    std::vector<SendOutcome>                   outcomes;
    std::vector<std::pair<size_t, QueuedFile>> valid_files;
    outcomes.reserve(paths.size());

    std::unique_lock lock {mutex_};
    for (const auto &path : paths)
    {
        SendOutcome outcome;
        outcome.path = path;

        QueuedFile  file;
        std::string error;
        if (resolve_file(path, file, error))
        {
            file.passive      = passive;
            outcome.filename  = file.filename;
            outcome.file_size = file.file_size;
            valid_files.emplace_back(outcomes.size(), std::move(file));
        }
        else
        {
            outcome.filename = std::filesystem::path {path}.filename().string();
            outcome.error    = "DCC SEND to " + peer + ": " + error;
            LOG(WARNING) << outcome.error;
        }
        outcomes.push_back(std::move(outcome));
    }

    auto queue_it  = queues_.find(peer_key(peer));
    bool can_start =
        !has_active_send(peer) && (queue_it == queues_.end() || queue_it->second.empty());
    bool no_ports  = false;

    for (size_t next = 0; next != valid_files.size();)
    {
        PreparedOffer prepared;
        size_t        started_index = 0;

        for (; next != valid_files.size() && !prepared.transfer; ++next)
        {
            auto &[index, file] = valid_files[next];
            auto &outcome       = outcomes[index];
            if (no_ports)
            {
                outcome.error =
                    "DCC SEND of '" + file.filename + "' to " + peer + ": No available ports";
                continue;
            }

            if (can_start)
            {
                auto result = start_send(peer, file, outcome, prepared);
                if (result == StartResult::STARTED)
                {
                    started_index = index;
                }
                else if (result == StartResult::NO_PORTS)
                {
                    no_ports = true;
                }
                continue;
            }

            auto &queue = queues_[peer_key(peer)];
            queue.push_back(file);
            outcome.result         = SendOutcome::Result::QUEUED;
            outcome.queue_position = queue.size();
            LOG(INFO) << "Queued DCC SEND of '" << file.filename << "' to " << peer
                      << " at position " << queue.size();
            observer_->on_transfer_queued(peer, file.path, queue.size());
        }

        if (!prepared.transfer)
        {
            break;
        }

        lock.unlock();
        bool delivered = deliver(prepared);
        lock.lock();

        if (delivered)
        {
            can_start = false;
        }
        else
        {
            forget_resume(prepared);
            auto &outcome         = outcomes[started_index];
            outcome.result        = SendOutcome::Result::ERROR;
            outcome.transfer_id   = {};
            outcome.token         = {};
            outcome.resume_offset = 0;
            outcome.error         = prepared.error;
            LOG(WARNING) << outcome.error;
        }
    }

    return outcomes;
}

bool SendOrchestrator::process_next_in_queue(const std::string &peer)
{
    std::unique_lock lock {mutex_};

    while (true)
    {
        auto it = queues_.find(peer_key(peer));
        if (it == queues_.end() || it->second.empty() || has_active_send(peer))
        {
            return false;
        }

        auto &queue = it->second;
        auto  file  = std::move(queue.front());
        queue.pop_front();
        if (queue.empty())
        {
            queues_.erase(it);
        }

        LOG(INFO) << "Starting next queued DCC SEND of '" << file.filename << "' to " << peer;
        SendOutcome   outcome;
        PreparedOffer prepared;
        if (start_send(peer, file, outcome, prepared) != StartResult::STARTED)
        {
            LOG(WARNING) << "Queued DCC SEND of '" << file.filename << "' to " << peer
                         << " could not start: " << outcome.error;
            continue;
        }

        lock.unlock();
        if (deliver(prepared))
        {
            return true;
        }
        lock.lock();

        forget_resume(prepared);
        LOG(WARNING) << "Queued DCC SEND of '" << file.filename << "' to " << peer
                     << " could not start: " << prepared.error;
    }
}

bool SendOrchestrator::handle_accept(const std::string &peer, const protocol::AcceptOffer &offer)
{
    using Kind = protocol::AcceptOffer::Kind;

    auto matches = registry_->find([&](const Transfer &t) {
        if (t.direction() != Direction::SEND || !boost::algorithm::iequals(t.peer(), peer) ||
            t.filename() != offer.filename)
        {
            return false;
        }
        switch (offer.kind)
        {
            case Kind::PASSIVE:
                return t.passive() && t.token() == offer.token &&
                       t.status() == TransferStatus::NEGOTIATING;
            case Kind::RESUME:
                return t.resume_offset() == offer.position &&
                       t.status() == TransferStatus::PENDING_RESUME;
            case Kind::ACTIVE:
                return !t.passive() && t.status() == TransferStatus::NEGOTIATING;
        }
        return false;
    });

    if (matches.empty())
    {
        LOG(WARNING) << "DCC ACCEPT from " << peer << " for '" << offer.filename
                     << "' matches no waiting send";
        return false;
    }
    if (matches.size() > 1)
    {
        LOG(WARNING) << "DCC ACCEPT from " << peer << " for '" << offer.filename << "' matches "
                     << matches.size() << " sends, ignoring it";
        return false;
    }

    const auto &transfer = matches.front();
    switch (offer.kind)
    {
        case Kind::PASSIVE:
            if (!transfer->set_peer_endpoint(offer.ip, offer.port))
            {
                transfer->abort("Peer sent an invalid endpoint " + offer.ip + ":" +
                                std::to_string(offer.port));
                return false;
            }
            if (!transfer->transition({TransferStatus::NEGOTIATING}, TransferStatus::CONNECTING))
            {
                return false;
            }
            LOG(INFO) << "Passive DCC SEND " << transfer->id() << " accepted by " << peer
                      << ", connecting to " << offer.ip << ":" << offer.port;
            start_mover(transfer);
            return true;
        case Kind::RESUME:
            LOG(INFO) << "DCC RESUME of '" << offer.filename << "' accepted by " << peer
                      << " at position " << offer.position;
            return transfer->transition(
                {TransferStatus::PENDING_RESUME}, TransferStatus::CONNECTING);
        case Kind::ACTIVE:
            return transfer->transition({TransferStatus::NEGOTIATING}, TransferStatus::CONNECTING);
    }
    return false;
}

bool SendOrchestrator::resume(
    const std::string &identifier, SendOutcome &outcome, std::string &error)
{
    {
        std::lock_guard lock {mutex_};
        if (!settings_.resume_enabled)
        {
            error = "Resuming transfers is disabled";
            return false;
        }
    }

    std::shared_ptr<Transfer> transfer;
    auto                      match = registry_->find_by_prefix(identifier, transfer);
    if (match == PrefixMatch::AMBIGUOUS)
    {
        error = "'" + identifier + "' matches more than one transfer";
        return false;
    }
    if (match == PrefixMatch::NOT_FOUND)
    {
        transfer = registry_->find_latest([&](const Transfer &t) {
            return t.filename() == identifier && is_interrupted(t.status());
        });
        if (!transfer)
        {
            error = "No interrupted transfer matches '" + identifier + "'";
            return false;
        }
    }

    if (transfer->direction() == Direction::RECEIVE)
    {
        error = "Cannot resume the receive of '" + transfer->filename() + "' from " +
                transfer->peer() + " from this side, ask " + transfer->peer() +
                " to send it again";
        return false;
    }
    if (!is_interrupted(transfer->status()))
    {
        error = "DCC SEND of '" + transfer->filename() + "' to " + transfer->peer() + " is " +
                to_string(transfer->status()) + " and cannot be resumed";
        return false;
    }

    auto outcomes = initiate_sends(transfer->peer(), {transfer->local_path()}, false);
    outcome       = outcomes.front();
    if (outcome.result == SendOutcome::Result::ERROR)
    {
        error = outcome.error;
        return false;
    }
    return true;
}

void SendOrchestrator::clear_queues()
{
    std::lock_guard lock {mutex_};
    queues_.clear();
}

std::vector<std::string> SendOrchestrator::queued(const std::string &peer) const
{
    std::lock_guard          lock {mutex_};
    std::vector<std::string> paths;

    auto it = queues_.find(peer_key(peer));
    if (it != queues_.end())
    {
        for (const auto &file : it->second)
        {
            paths.push_back(file.path);
        }
    }
    return paths;
}

bool SendOrchestrator::resolve_file(
    const std::string &requested_path, QueuedFile &file, std::string &error) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path        path {requested_path};
    if (path.is_relative() && !fs::exists(path, ec))
    {
        path = fs::path {settings_.upload_dir} / path;
    }

    if (!fs::is_regular_file(path, ec))
    {
        error = "File not found: " + requested_path;
        return false;
    }

    auto size = fs::file_size(path, ec);
    if (ec)
    {
        error = "Cannot get the size of '" + requested_path + "': " + ec.message();
        return false;
    }
    if (size > settings_.max_file_size)
    {
        error = "File '" + path.filename().string() + "' exceeds maximum size of " +
                std::to_string(settings_.max_file_size) + " bytes";
        return false;
    }

    auto absolute = fs::absolute(path, ec);
    file.path      = ec ? path.string() : absolute.lexically_normal().string();
    file.filename  = path.filename().string();
    file.file_size = size;
    return true;
}

bool SendOrchestrator::has_active_send(const std::string &peer) const
{
    return !registry_
                ->find([&](const Transfer &t) {
                    return t.direction() == Direction::SEND && !t.passive() &&
                           boost::algorithm::iequals(t.peer(), peer) && !is_terminal(t.status());
                })
                .empty();
}

SendOrchestrator::StartResult SendOrchestrator::start_send(const std::string &peer,
    const QueuedFile &file, SendOutcome &outcome, PreparedOffer &prepared)
{
    outcome.filename  = file.filename;
    outcome.file_size = file.file_size;

    if (!file.passive && settings_.resume_enabled)
    {
        auto candidates = resume_candidates(peer, file);
        if (candidates.size() > 1)
        {
            outcome.error = "DCC SEND of '" + file.filename + "' to " + peer +
                            ": more than one interrupted send could be resumed, remove all "
                            "but one of them";
            LOG(WARNING) << outcome.error;
            return StartResult::FAILED;
        }
        if (candidates.size() == 1)
        {
            return start_resume(peer, file, candidates.front(), outcome, prepared);
        }
    }

    return file.passive ? start_passive(peer, file, outcome, prepared)
                        : start_active(peer, file, outcome, prepared);
}

SendOrchestrator::StartResult SendOrchestrator::start_resume(const std::string &peer,
    const QueuedFile &file, const std::shared_ptr<Transfer> &interrupted, SendOutcome &outcome,
    PreparedOffer &prepared)
{
    auto offset   = interrupted->bytes_transferred();
    auto transfer = make_transfer(peer, file, offset);

    unsigned short port;
    if (!transfer->listen({settings_.port_range_start, settings_.port_range_end}, port))
    {
        outcome.error = "DCC RESUME of '" + file.filename + "' to " + peer + ": No available ports";
        LOG(ERROR) << outcome.error;
        return StartResult::NO_PORTS;
    }
    if (!registry_->add(transfer))
    {
        outcome.error = "DCC RESUME of '" + file.filename + "' to " + peer + ": id collision";
        return StartResult::FAILED;
    }
    observer_->on_transfer_created(transfer->id());
    transfer->set_status(TransferStatus::PENDING_RESUME);

    protocol::OfferCodec codec;
    prepared.transfer     = transfer;
    prepared.payload      = codec.format(protocol::ResumeOffer {file.filename, port, offset, {}});
    prepared.error        = "DCC RESUME of '" + file.filename + "' to " + peer +
                            ": the offer could not be sent";
    prepared.start_mover  = true;
    prepared.resumed_from = interrupted->id();
    resumed_ids_.insert(interrupted->id());

    LOG(INFO) << "Offering to resume '" << file.filename << "' to " << peer << " from offset "
              << offset << " on port " << port;
    outcome.result        = SendOutcome::Result::STARTED;
    outcome.transfer_id   = transfer->id();
    outcome.resume_offset = offset;
    return StartResult::STARTED;
}

SendOrchestrator::StartResult SendOrchestrator::start_active(const std::string &peer,
    const QueuedFile &file, SendOutcome &outcome, PreparedOffer &prepared)
{
    auto transfer = make_transfer(peer, file, 0);

    unsigned short port;
    if (!transfer->listen({settings_.port_range_start, settings_.port_range_end}, port))
    {
        outcome.error = "DCC SEND of '" + file.filename + "' to " + peer + ": No available ports";
        LOG(ERROR) << outcome.error;
        return StartResult::NO_PORTS;
    }
    if (!registry_->add(transfer))
    {
        outcome.error = "DCC SEND of '" + file.filename + "' to " + peer + ": id collision";
        return StartResult::FAILED;
    }
    observer_->on_transfer_created(transfer->id());
    transfer->set_status(TransferStatus::NEGOTIATING);

    protocol::OfferCodec codec;
    protocol::SendOffer  send {file.filename,
        address_resolver_->advertised_address(settings_.advertised_ip), port, file.file_size, {}};
    prepared.transfer    = transfer;
    prepared.payload     = codec.format(send);
    prepared.error       =
        "DCC SEND of '" + file.filename + "' to " + peer + ": the offer could not be sent";
    prepared.start_mover = true;

    LOG(INFO) << "Offering '" << file.filename << "' (" << file.file_size << " bytes) to " << peer
              << ", waiting on " << send.ip << ":" << port;
    outcome.result      = SendOutcome::Result::STARTED;
    outcome.transfer_id = transfer->id();
    return StartResult::STARTED;
}

SendOrchestrator::StartResult SendOrchestrator::start_passive(const std::string &peer,
    const QueuedFile &file, SendOutcome &outcome, PreparedOffer &prepared)
{
    auto transfer = make_transfer(peer, file, 0);
    if (!registry_->add(transfer))
    {
        outcome.error = "DCC SEND of '" + file.filename + "' to " + peer + ": id collision";
        return StartResult::FAILED;
    }
    observer_->on_transfer_created(transfer->id());
    transfer->set_status(TransferStatus::NEGOTIATING);

    // The mover starts once the peer accepts and tells where to connect
    protocol::OfferCodec codec;
    prepared.transfer = transfer;
    prepared.payload  = codec.format(
        protocol::SendOffer {file.filename, "0.0.0.0", 0, file.file_size, transfer->token()});
    prepared.error =
        "DCC SEND of '" + file.filename + "' to " + peer + ": the offer could not be sent";

    LOG(INFO) << "Offering '" << file.filename << "' to " << peer << " in passive mode with token "
              << transfer->token();
    outcome.result      = SendOutcome::Result::STARTED;
    outcome.transfer_id = transfer->id();
    outcome.token       = transfer->token();
    return StartResult::STARTED;
}

std::vector<std::shared_ptr<Transfer>> SendOrchestrator::resume_candidates(
    const std::string &peer, const QueuedFile &file) const
{
    return registry_->find([&](const Transfer &t) {
        if (t.direction() != Direction::SEND || !boost::algorithm::iequals(t.peer(), peer) ||
            t.filename() != file.filename || t.file_size() != file.file_size ||
            resumed_ids_.count(t.id()) != 0)
        {
            return false;
        }
        auto bytes = t.bytes_transferred();
        return is_interrupted(t.status()) && bytes > 0 && bytes < t.file_size();
    });
}

std::shared_ptr<SendTransfer> SendOrchestrator::make_transfer(
    const std::string &peer, const QueuedFile &file, uint64_t resume_offset)
{
    Transfer::Parameters params;
    params.id            = token_generator_->generate(transfer_id_bytes);
    params.peer          = peer;
    params.filename      = file.filename;
    params.file_size     = file.file_size;
    params.local_path    = file.path;
    params.resume_offset = resume_offset;
    params.passive       = file.passive;
    if (file.passive)
    {
        params.token = token_generator_->generate(token_bytes);
    }
    params.timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.transfer_timeout);
    params.bandwidth_limit    = settings_.send_limit_bytes_per_second();
    params.buffer_size        = settings_.buffer_size;
    params.checksum_verify    = settings_.checksum_verify;
    params.checksum_algorithm = settings_.checksum_algorithm;

    return std::make_shared<SendTransfer>(std::move(params), checksum_calculator_, observer_);
}

bool SendOrchestrator::offer(const std::shared_ptr<Transfer> &transfer, const std::string &payload)
{
    if (!ctcp_sender_->send_ctcp(transfer->peer(), payload))
    {
        transfer->abort("Cannot send the offer to " + transfer->peer());
        return false;
    }
    return true;
}

bool SendOrchestrator::deliver(const PreparedOffer &prepared)
{
    if (!offer(prepared.transfer, prepared.payload))
    {
        return false;
    }
    if (prepared.start_mover)
    {
        start_mover(prepared.transfer);
    }
    return true;
}

void SendOrchestrator::forget_resume(const PreparedOffer &prepared)
{
    if (!prepared.resumed_from.empty())
    {
        resumed_ids_.erase(prepared.resumed_from);
    }
}

void SendOrchestrator::forget(const std::string &transfer_id)
{
    std::lock_guard lock {mutex_};
    resumed_ids_.erase(transfer_id);
}

void SendOrchestrator::start_mover(const std::shared_ptr<Transfer> &transfer)
{
    io_executer_->add_job([transfer](const utils::CompletionToken & /*completion_token*/) {
        transfer->run();
    });
}

std::string SendOrchestrator::peer_key(const std::string &peer)
{
    return boost::algorithm::to_lower_copy(peer);
}
}  // namespace ircdcc::dcc
