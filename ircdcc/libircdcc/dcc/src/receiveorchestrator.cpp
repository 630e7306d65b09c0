#include "receiveorchestrator.hpp"

#include <filesystem>

#include <boost/algorithm/string.hpp>
#include <glog/logging.h>

#include "addressresolver.hpp"
#include "ctcpsender.hpp"
#include "downloadpathvalidator.hpp"
#include "executer.hpp"
#include "offercodec.hpp"
#include "receivetransfer.hpp"
#include "tokengenerator.hpp"
#include "transferobserver.hpp"
#include "transferregistry.hpp"

namespace ircdcc::dcc
{
namespace
{
constexpr size_t transfer_id_bytes = 16;

std::string offer_context(const std::string &peer, const std::string &filename)
{
    return "DCC offer of '" + filename + "' from " + peer + ": ";
}
}  // namespace

ReceiveOrchestrator::ReceiveOrchestrator(std::shared_ptr<TransferRegistry> registry,
    std::shared_ptr<network::CtcpSender>                                   ctcp_sender,
    std::shared_ptr<network::AddressResolver>                              address_resolver,
    std::shared_ptr<crypto::TokenGenerator>                                token_generator,
    std::shared_ptr<crypto::ChecksumCalculator>                            checksum_calculator,
    std::shared_ptr<TransferObserver>                                      observer,
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

void ReceiveOrchestrator::reconfigure(const DCCSettings &settings)
{
    std::lock_guard lock {mutex_};
    settings_ = settings;
}

std::string ReceiveOrchestrator::accept_active_offer(const std::string &peer,
    const std::string &filename, const std::string &ip, unsigned short port, uint64_t file_size,
    std::string &error)
{
    std::lock_guard lock {mutex_};

    auto pending = registry_->find_latest([&](const Transfer &t) {
        return t.direction() == Direction::RECEIVE && boost::algorithm::iequals(t.peer(), peer) &&
               t.filename() == filename && t.resume_offset() == 0 &&
               t.status() == TransferStatus::PENDING_ACCEPT &&
               pending_resumes_.count(t.id()) == 0;
    });

    std::shared_ptr<Transfer> transfer = pending;
    if (!transfer)
    {
        std::string local_path;
        if (!validate_path(peer, filename, file_size, local_path, error))
        {
            return {};
        }
        if (path_in_use(local_path))
        {
            error = offer_context(peer, filename) + local_path + " is already being written";
            LOG(WARNING) << error;
            return {};
        }
        transfer = make_transfer(peer, filename, file_size, local_path, 0, {});
    }

    if (!transfer->set_peer_endpoint(ip, port))
    {
        error = offer_context(peer, filename) + "invalid peer endpoint " + ip + ":" +
                std::to_string(port);
        if (pending)
        {
            transfer->abort(error);
        }
        return {};
    }

    if (pending)
    {
        if (!transfer->transition({TransferStatus::PENDING_ACCEPT}, TransferStatus::CONNECTING))
        {
            error = offer_context(peer, filename) + "the pending offer is no longer waiting";
            return {};
        }
    }
    else
    {
        if (!register_transfer(transfer, error))
        {
            return {};
        }
        transfer->set_status(TransferStatus::CONNECTING);
    }

    LOG(INFO) << "Accepted DCC SEND of '" << filename << "' from " << peer << ", connecting to "
              << ip << ":" << port;
    start_mover(transfer);
    return transfer->id();
}

std::string ReceiveOrchestrator::accept_passive_offer(const std::string &peer,
    const std::string &filename, uint64_t file_size, const std::string &token,
    const std::string &peer_ip, std::string &error)
{
    std::lock_guard lock {mutex_};

    std::string local_path;
    if (!validate_path(peer, filename, file_size, local_path, error))
    {
        return {};
    }
    if (path_in_use(local_path))
    {
        error = offer_context(peer, filename) + local_path + " is already being written";
        LOG(WARNING) << error;
        return {};
    }

    auto           transfer = make_transfer(peer, filename, file_size, local_path, 0, token);
    unsigned short port;
    if (!transfer->listen({settings_.port_range_start, settings_.port_range_end}, port))
    {
        error = offer_context(peer, filename) + "No available ports";
        LOG(ERROR) << error;
        return {};
    }
    if (!register_transfer(transfer, error))
    {
        return {};
    }
    transfer->set_status(TransferStatus::NEGOTIATING);

    protocol::OfferCodec  codec;
    protocol::AcceptOffer accept {protocol::AcceptOffer::Kind::PASSIVE, filename,
        address_resolver_->advertised_address(settings_.advertised_ip), port, 0, token};
    if (!ctcp_sender_->send_ctcp(peer, codec.format(accept)))
    {
        error = offer_context(peer, filename) + "cannot send the ACCEPT";
        transfer->abort(error);
        return {};
    }

    LOG(INFO) << "Accepted passive DCC SEND of '" << filename << "' from " << peer << " ("
              << peer_ip << "), waiting on " << accept.ip << ":" << port;
    start_mover(transfer);
    return transfer->id();
}

std::string ReceiveOrchestrator::accept_resume_offer(const std::string &peer,
    const std::string &filename, const std::string &peer_ip, unsigned short peer_port,
    uint64_t position, uint64_t total_size, const std::string &local_path, std::string &error)
{
    std::lock_guard lock {mutex_};

    if (!check_resume_position(peer, filename, local_path, position, error))
    {
        return {};
    }
    if (path_in_use(local_path))
    {
        error = offer_context(peer, filename) + local_path + " is already being written";
        LOG(WARNING) << error;
        return {};
    }

    auto transfer = make_transfer(peer, filename, total_size, local_path, position, {});
    if (!transfer->set_peer_endpoint(peer_ip, peer_port))
    {
        error = offer_context(peer, filename) + "invalid peer endpoint " + peer_ip + ":" +
                std::to_string(peer_port);
        return {};
    }
    if (!reply_resume_accept(peer, filename, peer_port, position, error))
    {
        return {};
    }
    if (!register_transfer(transfer, error))
    {
        return {};
    }
    transfer->set_status(TransferStatus::CONNECTING);

    LOG(INFO) << "Resuming '" << filename << "' from " << peer << " at offset " << position;
    start_mover(transfer);
    return transfer->id();
}

std::string ReceiveOrchestrator::register_pending_offer(
    const PendingOffer &offer, std::string &error)
{
    std::lock_guard lock {mutex_};

    std::string local_path = offer.local_path;
    if (offer.resume)
    {
        if (!check_resume_position(offer.peer, offer.filename, local_path, offer.position, error))
        {
            return {};
        }
    }
    else if (!validate_path(offer.peer, offer.filename, offer.file_size, local_path, error))
    {
        return {};
    }

    if (path_in_use(local_path))
    {
        error = offer_context(offer.peer, offer.filename) + local_path +
                " is already being written";
        LOG(WARNING) << error;
        return {};
    }

    auto transfer = make_transfer(offer.peer, offer.filename, offer.file_size, local_path,
        offer.resume ? offer.position : 0, {});
    if (!transfer->set_peer_endpoint(offer.ip, offer.port))
    {
        error = offer_context(offer.peer, offer.filename) + "invalid peer endpoint " + offer.ip +
                ":" + std::to_string(offer.port);
        return {};
    }
    if (!register_transfer(transfer, error))
    {
        return {};
    }
    if (offer.resume)
    {
        pending_resumes_.insert(transfer->id());
    }
    transfer->set_status(TransferStatus::PENDING_ACCEPT);

    LOG(INFO) << "DCC " << (offer.resume ? "RESUME" : "SEND") << " of '" << offer.filename
              << "' from " << offer.peer << " is waiting for confirmation as "
              << transfer->id();
    return transfer->id();
}

bool ReceiveOrchestrator::confirm_pending(const std::string &transfer_id, std::string &error)
{
    std::lock_guard lock {mutex_};

    auto transfer = registry_->get(transfer_id);
    if (!transfer || transfer->direction() != Direction::RECEIVE ||
        transfer->status() != TransferStatus::PENDING_ACCEPT)
    {
        error = "Transfer " + transfer_id + " is not waiting for confirmation";
        return false;
    }

    if (pending_resumes_.erase(transfer_id) != 0)
    {
        auto info = transfer->info();
        if (!check_resume_position(
                info.peer, info.filename, info.local_path, info.resume_offset, error) ||
            !reply_resume_accept(info.peer, info.filename, info.peer_port, info.resume_offset,
                error))
        {
            transfer->abort(error);
            return false;
        }
    }

    if (!transfer->transition({TransferStatus::PENDING_ACCEPT}, TransferStatus::CONNECTING))
    {
        error = "Transfer " + transfer_id + " is no longer waiting for confirmation";
        return false;
    }

    LOG(INFO) << "Confirmed DCC transfer " << transfer_id << " of '" << transfer->filename()
              << "' from " << transfer->peer();
    start_mover(transfer);
    return true;
}

bool ReceiveOrchestrator::validate_path(const std::string &peer, const std::string &filename,
    uint64_t file_size, std::string &local_path, std::string &error) const
{
    storage::DownloadPathValidator validator {
        settings_.download_dir, settings_.blocked_extensions, settings_.max_file_size};
    storage::DownloadPathValidator::Result result;
    std::string                            reason;
    auto is_reserved = [this](const std::string &path) { return path_in_use(path); };
    if (!validator.validate(filename, file_size, result, reason, is_reserved))
    {
        error = offer_context(peer, filename) + reason;
        LOG(WARNING) << error;
        return false;
    }
    local_path = result.safe_path;
    return true;
}

bool ReceiveOrchestrator::check_resume_position(const std::string &peer,
    const std::string &filename, const std::string &local_path, uint64_t position,
    std::string &error) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(local_path, ec))
    {
        if (position == 0)
        {
            return true;
        }
        error = offer_context(peer, filename) + "cannot resume at " + std::to_string(position) +
                ", " + local_path + " does not exist";
        LOG(WARNING) << error;
        return false;
    }

    auto size = fs::file_size(local_path, ec);
    if (ec || size != position)
    {
        error = offer_context(peer, filename) + "cannot resume at " + std::to_string(position) +
                ", " + local_path + " holds " +
                (ec ? std::string {"unknown"} : std::to_string(size)) + " bytes";
        LOG(WARNING) << error;
        return false;
    }
    return true;
}

bool ReceiveOrchestrator::path_in_use(const std::string &local_path) const
{
    return !registry_
                ->find([&](const Transfer &t) {
                    return t.direction() == Direction::RECEIVE &&
                           t.local_path() == local_path && !is_terminal(t.status());
                })
                .empty();
}

std::shared_ptr<ReceiveTransfer> ReceiveOrchestrator::make_transfer(const std::string &peer,
    const std::string &filename, uint64_t file_size, const std::string &local_path,
    uint64_t resume_offset, const std::string &token)
{
    Transfer::Parameters params;
    params.id            = token_generator_->generate(transfer_id_bytes);
    params.peer          = peer;
    params.filename      = filename;
    params.file_size     = file_size;
    params.local_path    = local_path;
    params.resume_offset = resume_offset;
    params.passive       = !token.empty();
    params.token         = token;
    params.timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.transfer_timeout);
    params.bandwidth_limit    = settings_.recv_limit_bytes_per_second();
    params.buffer_size        = settings_.buffer_size;
    params.checksum_verify    = settings_.checksum_verify;
    params.checksum_algorithm = settings_.checksum_algorithm;

    return std::make_shared<ReceiveTransfer>(std::move(params), checksum_calculator_, observer_);
}

bool ReceiveOrchestrator::register_transfer(
    const std::shared_ptr<Transfer> &transfer, std::string &error)
{
    if (!registry_->add(transfer))
    {
        error = offer_context(transfer->peer(), transfer->filename()) + "transfer id collision";
        LOG(ERROR) << error;
        return false;
    }
    observer_->on_transfer_created(transfer->id());
    return true;
}

bool ReceiveOrchestrator::reply_resume_accept(const std::string &peer, const std::string &filename,
    unsigned short port, uint64_t position, std::string &error)
{
    protocol::OfferCodec  codec;
    protocol::AcceptOffer accept {
        protocol::AcceptOffer::Kind::RESUME, filename, {}, port, position, {}};
    if (!ctcp_sender_->send_ctcp(peer, codec.format(accept)))
    {
        error = offer_context(peer, filename) + "cannot send the ACCEPT";
        LOG(ERROR) << error;
        return false;
    }
    return true;
}

void ReceiveOrchestrator::start_mover(const std::shared_ptr<Transfer> &transfer)
{
    io_executer_->add_job([transfer](const utils::CompletionToken & /*completion_token*/) {
        transfer->run();
    });
}
}  // namespace ircdcc::dcc
