#include "transferregistry.hpp"

#include <algorithm>
#include <iterator>

#include <glog/logging.h>

#include "transfer.hpp"

namespace ircdcc::dcc
{
bool TransferRegistry::add(const TransferPtr &transfer)
{
    std::lock_guard lock {mutex_};
    auto            it = std::find_if(transfers_.cbegin(), transfers_.cend(),
        [&](const TransferPtr &t) { return t->id() == transfer->id(); });
    if (it != transfers_.cend())
    {
        LOG(ERROR) << "Transfer id collision: " << transfer->id();
        return false;
    }
    transfers_.push_back(transfer);
    return true;
}

TransferRegistry::TransferPtr TransferRegistry::get(const std::string &id) const
{
    std::lock_guard lock {mutex_};
    auto            it = std::find_if(transfers_.cbegin(), transfers_.cend(),
        [&](const TransferPtr &t) { return t->id() == id; });
    return it == transfers_.cend() ? nullptr : *it;
}

bool TransferRegistry::remove(const std::string &id)
{
    std::lock_guard lock {mutex_};
    auto            it = std::find_if(transfers_.cbegin(), transfers_.cend(),
        [&](const TransferPtr &t) { return t->id() == id; });
    if (it == transfers_.cend())
    {
        return false;
    }
    transfers_.erase(it);
    return true;
}

std::vector<TransferRegistry::TransferPtr> TransferRegistry::all() const
{
    std::lock_guard lock {mutex_};
    return transfers_;
}

std::vector<TransferRegistry::TransferPtr> TransferRegistry::find(
    const Predicate &predicate) const
{
    auto                     snapshot = all();
    std::vector<TransferPtr> result;
    std::copy_if(snapshot.cbegin(), snapshot.cend(), std::back_inserter(result),
        [&](const TransferPtr &t) { return predicate(*t); });
    return result;
}

TransferRegistry::TransferPtr TransferRegistry::find_latest(const Predicate &predicate) const
{
    auto snapshot = all();
    auto it       = std::find_if(snapshot.crbegin(), snapshot.crend(),
        [&](const TransferPtr &t) { return predicate(*t); });
    return it == snapshot.crend() ? nullptr : *it;
}

PrefixMatch TransferRegistry::find_by_prefix(
    const std::string &prefix, TransferPtr &transfer) const
{
    if (prefix.empty())
    {
        return PrefixMatch::NOT_FOUND;
    }

    auto matches =
        find([&](const Transfer &t) { return t.id().compare(0, prefix.size(), prefix) == 0; });
    if (matches.empty())
    {
        return PrefixMatch::NOT_FOUND;
    }

    auto exact = std::find_if(matches.cbegin(), matches.cend(),
        [&](const TransferPtr &t) { return t->id() == prefix; });
    if (exact != matches.cend())
    {
        transfer = *exact;
        return PrefixMatch::FOUND;
    }
    if (matches.size() > 1)
    {
        return PrefixMatch::AMBIGUOUS;
    }

    transfer = matches.front();
    return PrefixMatch::FOUND;
}

size_t TransferRegistry::size() const
{
    std::lock_guard lock {mutex_};
    return transfers_.size();
}
}  // namespace ircdcc::dcc
