#ifndef IRCDCC_DCC_PASSIVEOFFERSTORE_HPP_
#define IRCDCC_DCC_PASSIVEOFFERSTORE_HPP_

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "passiveofferrecord.hpp"
#include "prefixmatch.hpp"

namespace ircdcc::dcc
{
class PassiveOfferStore
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit PassiveOfferStore(NowFn now = Clock::now);

    // A record with the same token is replaced
    void store(const std::string &token, const std::string &nick, const std::string &filename,
        uint64_t file_size, const std::string &ip, const std::string &userhost);
    bool retrieve(const std::string &token, PassiveOfferRecord &record) const;
    bool remove(const std::string &token);

    PrefixMatch find_by_prefix(const std::string &prefix, PassiveOfferRecord &record) const;
    PrefixMatch cancel_by_prefix(const std::string &prefix, PassiveOfferRecord &record);

    // Returns the number of records older than the timeout that were dropped
    size_t evict_stale(std::chrono::seconds timeout);

    // Newest first
    [[nodiscard]] std::vector<PassiveOfferRecord> list() const;
    [[nodiscard]] std::vector<std::string>        status_lines() const;
    [[nodiscard]] size_t                          size() const;

private:
    PrefixMatch find_by_prefix_locked(const std::string &prefix, std::string &token) const;

    const NowFn                               now_;
    std::map<std::string, PassiveOfferRecord> offers_;
    mutable std::mutex                        mutex_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_PASSIVEOFFERSTORE_HPP_
