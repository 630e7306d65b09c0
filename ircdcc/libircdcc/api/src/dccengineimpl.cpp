#include "dccengineimpl.hpp"

#include <glog/logging.h>

#include "addressresolverimpl.hpp"
#include "checksumcalculatorimpl.hpp"
#include "ctcpsender.hpp"
#include "dccmanager.hpp"
#include "dccsettings.hpp"
#include "defaultconfigvalues.hpp"
#include "iothreadpool.hpp"
#include "jsonconfigloader.hpp"
#include "threadpool.hpp"
#include "tokengeneratorimpl.hpp"

namespace ircdcc
{
namespace
{
// Relays manager events to the listeners registered on the engine, which outlive any manager
class EventForwarder : public dcc::DCCEventListener
{
public:
    explicit EventForwarder(utils::ListenerGroup<dcc::DCCEventListener> &listener_group)
        : listener_group_ {listener_group}
    {}

    void on_transfer_created(const dcc::TransferInfo &info) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_transfer_created, info);
    }

    void on_send_queued(
        const std::string &peer, const std::string &file_path, size_t queue_position) override
    {
        listener_group_.notify(
            &dcc::DCCEventListener::on_send_queued, peer, file_path, queue_position);
    }

    void on_status_changed(const dcc::TransferInfo &info) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_status_changed, info);
    }

    void on_progress_changed(const dcc::TransferInfo &info) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_progress_changed, info);
    }

    void on_checksum_updated(const dcc::TransferInfo &info) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_checksum_updated, info);
    }

    void on_offer_received(const dcc::OfferInfo &offer) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_offer_received, offer);
    }

    void on_offer_rejected(const dcc::OfferInfo &offer, const std::string &reason) override
    {
        listener_group_.notify(&dcc::DCCEventListener::on_offer_rejected, offer, reason);
    }

private:
    utils::ListenerGroup<dcc::DCCEventListener> &listener_group_;
};

const std::string not_running_error = "DCC engine is not running";
}  // namespace

DCCEngineImpl::DCCEngineImpl(
    std::string config_file_path, std::shared_ptr<network::CtcpSender> ctcp_sender)
    : config_file_path_ {std::move(config_file_path)}
    , ctcp_sender_ {std::move(ctcp_sender)}
    , cfg_ {load_config()}
    , event_forwarder_ {std::make_shared<EventForwarder>(listener_group_)}
{}

DCCEngineImpl::~DCCEngineImpl()
{
    stop();
}

bool DCCEngineImpl::register_listener(const std::shared_ptr<dcc::DCCEventListener> &listener)
{
    return listener_group_.add(listener);
}

bool DCCEngineImpl::unregister_listener(const std::shared_ptr<dcc::DCCEventListener> &listener)
{
    return listener_group_.remove(listener);
}

bool DCCEngineImpl::start()
{
    std::lock_guard lock {mutex_};
    if (manager_)
    {
        LOG(WARNING) << "DCC engine already running";
        return false;
    }

    auto settings = dcc::DCCSettings::from_config(*cfg_);

    event_thread_   = std::make_shared<utils::ThreadPool>(1);
    io_thread_pool_ = std::make_shared<utils::IOThreadPool>();
    manager_        = std::make_shared<dcc::DCCManager>(ctcp_sender_,
        std::make_shared<network::AddressResolverImpl>(),
        std::make_shared<crypto::TokenGeneratorImpl>(),
        std::make_shared<crypto::ChecksumCalculatorImpl>(), event_thread_, io_thread_pool_,
        settings);
    manager_->register_listener(event_forwarder_);
    manager_->start();

    LOG(INFO) << "DCC engine started, downloads go to " << settings.download_dir;
    return true;
}

bool DCCEngineImpl::stop()
{
    std::shared_ptr<dcc::DCCManager>     manager;
    std::shared_ptr<utils::ThreadPool>   event_thread;
    std::shared_ptr<utils::IOThreadPool> io_thread_pool;
    {
        std::lock_guard lock {mutex_};
        if (!manager_)
        {
            return false;
        }
        manager        = std::move(manager_);
        event_thread   = std::move(event_thread_);
        io_thread_pool = std::move(io_thread_pool_);
    }

    // Listeners may call back into the engine while the manager winds down
    manager->shutdown();
    manager.reset();
    event_thread.reset();
    io_thread_pool.reset();

    LOG(INFO) << "DCC engine stopped";
    return true;
}

bool DCCEngineImpl::reload_config()
{
    auto cfg      = load_config();
    auto settings = dcc::DCCSettings::from_config(*cfg);

    std::shared_ptr<dcc::DCCManager> manager;
    {
        std::lock_guard lock {mutex_};
        cfg_    = std::move(cfg);
        manager = manager_;
    }

    if (manager)
    {
        manager->reconfigure(settings);
    }
    LOG(INFO) << "Configuration reloaded from " << config_file_path_;
    return true;
}

bool DCCEngineImpl::dispatch_incoming_ctcp(
    const std::string &nick, const std::string &userhost, const std::string &payload)
{
    std::string error;
    auto        manager = this->manager(error);
    if (!manager)
    {
        LOG(WARNING) << error << ", dropping payload from " << nick;
        return false;
    }
    return manager->dispatch_incoming_ctcp(nick, userhost, payload);
}

std::vector<dcc::SendOutcome> DCCEngineImpl::send(
    const std::string &peer, const std::vector<std::string> &paths, bool passive)
{
    std::string error;
    auto        manager = this->manager(error);
    if (!manager)
    {
        std::vector<dcc::SendOutcome> outcomes(paths.size());
        for (size_t i = 0; i != paths.size(); ++i)
        {
            outcomes[i].path  = paths[i];
            outcomes[i].error = error;
        }
        return outcomes;
    }
    return manager->send(peer, paths, passive);
}

std::string DCCEngineImpl::accept_active_offer(const std::string &peer,
    const std::string &filename, const std::string &ip, unsigned short port, uint64_t file_size,
    std::string &error)
{
    auto manager = this->manager(error);
    return manager ? manager->accept_active_offer(peer, filename, ip, port, file_size, error) :
                     std::string {};
}

std::string DCCEngineImpl::accept_passive_offer(const std::string &token_prefix, std::string &error)
{
    auto manager = this->manager(error);
    return manager ? manager->accept_passive_offer(token_prefix, error) : std::string {};
}

bool DCCEngineImpl::confirm(const std::string &id_prefix, std::string &error)
{
    auto manager = this->manager(error);
    return manager && manager->confirm(id_prefix, error);
}

bool DCCEngineImpl::cancel(const std::string &prefix, std::string &message)
{
    auto manager = this->manager(message);
    return manager && manager->cancel_by_prefix(prefix, message);
}

bool DCCEngineImpl::resume(
    const std::string &identifier, dcc::SendOutcome &outcome, std::string &error)
{
    auto manager = this->manager(error);
    return manager && manager->resume(identifier, outcome, error);
}

bool DCCEngineImpl::remove(const std::string &id_prefix, std::string &error)
{
    auto manager = this->manager(error);
    return manager && manager->remove(id_prefix, error);
}

std::vector<dcc::TransferInfo> DCCEngineImpl::transfers() const
{
    std::string error;
    auto        manager = this->manager(error);
    return manager ? manager->transfers() : std::vector<dcc::TransferInfo> {};
}

std::vector<dcc::PassiveOfferRecord> DCCEngineImpl::passive_offers() const
{
    std::string error;
    auto        manager = this->manager(error);
    return manager ? manager->passive_offers() : std::vector<dcc::PassiveOfferRecord> {};
}

std::vector<std::string> DCCEngineImpl::status_lines() const
{
    std::string error;
    auto        manager = this->manager(error);
    return manager ? manager->status_lines() : std::vector<std::string> {};
}

std::unique_ptr<config::Config> DCCEngineImpl::load_config() const
{
    return std::make_unique<config::Config>(
        config::JSONConfigLoader {config_file_path_}, std::make_unique<DefaultConfigValues>());
}

std::shared_ptr<dcc::DCCManager> DCCEngineImpl::manager(std::string &error) const
{
    std::lock_guard lock {mutex_};
    if (!manager_)
    {
        error = not_running_error;
    }
    return manager_;
}
}  // namespace ircdcc
