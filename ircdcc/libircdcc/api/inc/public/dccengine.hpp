#ifndef IRCDCC_API_DCCENGINE_HPP_
#define IRCDCC_API_DCCENGINE_HPP_

#include <memory>
#include <string>
#include <vector>

#include "ircdcc/commondefs.h"
#include "offerinfo.hpp"
#include "passiveofferrecord.hpp"
#include "sendoutcome.hpp"
#include "transferinfo.hpp"

namespace ircdcc
{
namespace dcc
{
// Forward declarations
class DCCEventListener;
}  // namespace dcc

namespace network
{
// Forward declarations
class CtcpSender;
}  // namespace network

// Forward declarations
class DCCEngineImpl;

class IRCDCC_API DCCEngine
{
public:
    DCCEngine(
        const std::string &config_file_path, std::shared_ptr<network::CtcpSender> ctcp_sender);
    DCCEngine(DCCEngine &&other) noexcept;
    DCCEngine &operator=(DCCEngine &&rhs) noexcept;
    ~DCCEngine();

    bool register_listener(const std::shared_ptr<dcc::DCCEventListener> &listener);
    bool unregister_listener(const std::shared_ptr<dcc::DCCEventListener> &listener);

    bool start();
    bool stop();

    // Reads the configuration file again and applies it to new transfers
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
    std::unique_ptr<DCCEngineImpl> impl_;
};
}  // namespace ircdcc

#endif  // IRCDCC_API_DCCENGINE_HPP_
