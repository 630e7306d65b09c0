#include "dccengine.hpp"

#include "dccengineimpl.hpp"

namespace ircdcc
{
DCCEngine::DCCEngine(
    const std::string &config_file_path, std::shared_ptr<network::CtcpSender> ctcp_sender)
    : impl_ {std::make_unique<DCCEngineImpl>(config_file_path, std::move(ctcp_sender))}
{}

DCCEngine::DCCEngine(DCCEngine &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

DCCEngine &DCCEngine::operator=(DCCEngine &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

DCCEngine::~DCCEngine() = default;

bool DCCEngine::register_listener(const std::shared_ptr<dcc::DCCEventListener> &listener)
{
    return impl_->register_listener(listener);
}

bool DCCEngine::unregister_listener(const std::shared_ptr<dcc::DCCEventListener> &listener)
{
    return impl_->unregister_listener(listener);
}

bool DCCEngine::start()
{
    return impl_->start();
}

bool DCCEngine::stop()
{
    return impl_->stop();
}

bool DCCEngine::reload_config()
{
    return impl_->reload_config();
}

bool DCCEngine::dispatch_incoming_ctcp(
    const std::string &nick, const std::string &userhost, const std::string &payload)
{
    return impl_->dispatch_incoming_ctcp(nick, userhost, payload);
}

std::vector<dcc::SendOutcome> DCCEngine::send(
    const std::string &peer, const std::vector<std::string> &paths, bool passive)
{
    return impl_->send(peer, paths, passive);
}

std::string DCCEngine::accept_active_offer(const std::string &peer, const std::string &filename,
    const std::string &ip, unsigned short port, uint64_t file_size, std::string &error)
{
    return impl_->accept_active_offer(peer, filename, ip, port, file_size, error);
}

std::string DCCEngine::accept_passive_offer(const std::string &token_prefix, std::string &error)
{
    return impl_->accept_passive_offer(token_prefix, error);
}

bool DCCEngine::confirm(const std::string &id_prefix, std::string &error)
{
    return impl_->confirm(id_prefix, error);
}

bool DCCEngine::cancel(const std::string &prefix, std::string &message)
{
    return impl_->cancel(prefix, message);
}

bool DCCEngine::resume(const std::string &identifier, dcc::SendOutcome &outcome, std::string &error)
{
    return impl_->resume(identifier, outcome, error);
}

bool DCCEngine::remove(const std::string &id_prefix, std::string &error)
{
    return impl_->remove(id_prefix, error);
}

std::vector<dcc::TransferInfo> DCCEngine::transfers() const
{
    return impl_->transfers();
}

std::vector<dcc::PassiveOfferRecord> DCCEngine::passive_offers() const
{
    return impl_->passive_offers();
}

std::vector<std::string> DCCEngine::status_lines() const
{
    return impl_->status_lines();
}
}  // namespace ircdcc
