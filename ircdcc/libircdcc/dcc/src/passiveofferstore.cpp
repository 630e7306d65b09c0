#include "passiveofferstore.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace ircdcc::dcc
{
PassiveOfferStore::PassiveOfferStore(NowFn now)
    : now_ {std::move(now)}
{}

void PassiveOfferStore::store(const std::string &token, const std::string &nick,
    const std::string &filename, uint64_t file_size, const std::string &ip,
    const std::string &userhost)
{
    std::lock_guard lock {mutex_};
    offers_[token] = {token, nick, filename, file_size, ip, userhost, now_()};
    LOG(INFO) << "Stored passive offer " << token << " from " << nick << " for '" << filename
              << "'";
}

bool PassiveOfferStore::retrieve(const std::string &token, PassiveOfferRecord &record) const
{
    std::lock_guard lock {mutex_};
    auto            it = offers_.find(token);
    if (it == offers_.end())
    {
        return false;
    }
    record = it->second;
    return true;
}

bool PassiveOfferStore::remove(const std::string &token)
{
    std::lock_guard lock {mutex_};
    return offers_.erase(token) != 0;
}

PrefixMatch PassiveOfferStore::find_by_prefix(
    const std::string &prefix, PassiveOfferRecord &record) const
{
    std::lock_guard lock {mutex_};
    std::string     token;
    auto            match = find_by_prefix_locked(prefix, token);
    if (match == PrefixMatch::FOUND)
    {
        record = offers_.at(token);
    }
    return match;
}

PrefixMatch PassiveOfferStore::cancel_by_prefix(
    const std::string &prefix, PassiveOfferRecord &record)
{
    std::lock_guard lock {mutex_};
    std::string     token;
    auto            match = find_by_prefix_locked(prefix, token);
    if (match == PrefixMatch::FOUND)
    {
        auto it = offers_.find(token);
        record  = it->second;
        offers_.erase(it);
        LOG(INFO) << "Cancelled passive offer " << token << " from " << record.nick;
    }
    return match;
}

PrefixMatch PassiveOfferStore::find_by_prefix_locked(
    const std::string &prefix, std::string &token) const
{
    if (prefix.empty())
    {
        return PrefixMatch::NOT_FOUND;
    }

    if (offers_.count(prefix) != 0)
    {
        token = prefix;
        return PrefixMatch::FOUND;
    }

    // Keys are ordered, so every token sharing the prefix sits in one contiguous range
    size_t matches = 0;
    for (auto it = offers_.lower_bound(prefix);
         it != offers_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it)
    {
        token = it->first;
        ++matches;
    }

    if (matches == 0)
    {
        return PrefixMatch::NOT_FOUND;
    }
    return matches == 1 ? PrefixMatch::FOUND : PrefixMatch::AMBIGUOUS;
}

size_t PassiveOfferStore::evict_stale(std::chrono::seconds timeout)
{
    std::lock_guard lock {mutex_};
    auto            now     = now_();
    size_t          evicted = 0;
    for (auto it = offers_.begin(); it != offers_.end();)
    {
        if (now - it->second.created_at > timeout)
        {
            LOG(INFO) << "Passive offer " << it->first << " from " << it->second.nick
                      << " expired";
            it = offers_.erase(it);
            ++evicted;
        }
        else
        {
            ++it;
        }
    }
    return evicted;
}

std::vector<PassiveOfferRecord> PassiveOfferStore::list() const
{
    std::vector<PassiveOfferRecord> records;
    {
        std::lock_guard lock {mutex_};
        records.reserve(offers_.size());
        for (const auto &[token, record] : offers_)
        {
            records.push_back(record);
        }
    }

    std::sort(records.begin(), records.end(),
        [](const auto &lhs, const auto &rhs) { return lhs.created_at > rhs.created_at; });
    return records;
}

std::vector<std::string> PassiveOfferStore::status_lines() const
{
    auto records = list();
    auto now     = now_();

    std::vector<std::string> lines;
    lines.reserve(records.size());
    for (const auto &record : records)
    {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - record.created_at);

        std::ostringstream ss;
        ss << "Token: " << record.token.substr(0, 8) << "... From: " << record.nick
           << ", File: '" << record.filename << "' (" << std::fixed << std::setprecision(2)
           << double(record.file_size) / (1024.0 * 1024.0) << "MB). Received: " << age.count()
           << "s ago. Use: get " << record.token;
        lines.push_back(ss.str());
    }
    return lines;
}

size_t PassiveOfferStore::size() const
{
    std::lock_guard lock {mutex_};
    return offers_.size();
}
}  // namespace ircdcc::dcc
