#ifndef IRCDCC_API_DCCENGINEIMPL_HPP_
#define IRCDCC_API_DCCENGINEIMPL_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "dcceventlistener.hpp"
#include "listenergroup.hpp"
#include "passiveofferrecord.hpp"
#include "sendoutcome.hpp"
#include "transferinfo.hpp"

namespace ircdcc
{
namespace utils
{
// Forward declarations
class ThreadPool;
class IOThreadPool;
}  // namespace utils

namespace network
{
// Forward declarations
class CtcpSender;
}  // namespace network

namespace dcc
{
// Forward declarations
class DCCManager;
}  // namespace dcc

class DCCEngineImpl
{
public:
    DCCEngineImpl(std::string config_file_path, std::shared_ptr<network::CtcpSender> ctcp_sender);
    ~DCCEngineImpl();

    bool register_listener(const std::shared_ptr<dcc::DCCEventListener> &listener);
    bool unregister_listener(const std::shared_ptr<dcc::DCCEventListener> &listener);

    bool start();
    bool stop();
    bool reload_config();

    bool dispatch_incoming_ctcp(
        const std::string &nick, const std::string &userhost, const std::string &payload);

    std::vector<dcc::SendOutcome> send(
        const std::string &peer, const std::vector<std::string> &paths, bool passive);
    std::string accept_active_offer(const std::string &peer, const std::string &filename,
        const std::string &ip, unsigned short port, uint64_t file_size, std::string &error);
    std::string accept_passive_offer(const std::string &token_prefix, std::string &error);
    bool        confirm(const std::string &id_prefix, std::string &error);
    bool        cancel(const std::string &prefix, std::string &message);
    bool resume(const std::string &identifier, dcc::SendOutcome &outcome, std::string &error);
    bool remove(const std::string &id_prefix, std::string &error);

    [[nodiscard]] std::vector<dcc::TransferInfo>       transfers() const;
    [[nodiscard]] std::vector<dcc::PassiveOfferRecord> passive_offers() const;
    [[nodiscard]] std::vector<std::string>             status_lines() const;

private:
    std::unique_ptr<config::Config> load_config() const;

    // Null while the engine is stopped
    std::shared_ptr<dcc::DCCManager> manager(std::string &error) const;

    const std::string                                 config_file_path_;
    const std::shared_ptr<network::CtcpSender>        ctcp_sender_;
    std::unique_ptr<config::Config>                   cfg_;
    utils::ListenerGroup<dcc::DCCEventListener>       listener_group_;
    std::shared_ptr<dcc::DCCEventListener>            event_forwarder_;
    std::shared_ptr<utils::ThreadPool>                event_thread_;
    std::shared_ptr<utils::IOThreadPool>              io_thread_pool_;
    std::shared_ptr<dcc::DCCManager>                  manager_;
    mutable std::mutex                                mutex_;
};
}  // namespace ircdcc

#endif  // IRCDCC_API_DCCENGINEIMPL_HPP_
