#ifndef IRCDCC_DCC_TRANSFERREGISTRY_HPP_
#define IRCDCC_DCC_TRANSFERREGISTRY_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "prefixmatch.hpp"

namespace ircdcc::dcc
{
// Forward declarations
class Transfer;

// Owns every transfer by id, in creation order. The lock only covers the container, predicates
// are evaluated on a snapshot.
class TransferRegistry
{
public:
    using TransferPtr = std::shared_ptr<Transfer>;
    using Predicate   = std::function<bool(const Transfer &)>;

    bool                                   add(const TransferPtr &transfer);
    [[nodiscard]] TransferPtr              get(const std::string &id) const;
    bool                                   remove(const std::string &id);
    [[nodiscard]] std::vector<TransferPtr> all() const;
    [[nodiscard]] std::vector<TransferPtr> find(const Predicate &predicate) const;

    // Newest transfer matching the predicate
    [[nodiscard]] TransferPtr find_latest(const Predicate &predicate) const;

    PrefixMatch          find_by_prefix(const std::string &prefix, TransferPtr &transfer) const;
    [[nodiscard]] size_t size() const;

private:
    std::vector<TransferPtr> transfers_;
    mutable std::mutex       mutex_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFERREGISTRY_HPP_
