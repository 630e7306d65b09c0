#ifndef IRCDCC_DCC_TRANSFEROBSERVERDELEGATE_HPP_
#define IRCDCC_DCC_TRANSFEROBSERVERDELEGATE_HPP_

#include <functional>
#include <mutex>

#include "transferobserver.hpp"

namespace ircdcc::dcc
{
// Forwards observer calls to callbacks, so an owner can observe its transfers without being
// shared-owned by them. Transfers may outlive the owner, which must call clear_callbacks()
// before it goes away.
class TransferObserverDelegate : public TransferObserver
{
public:
    using OnTransferCreatedCb = std::function<void(const std::string &)>;
    using OnTransferQueuedCb =
        std::function<void(const std::string &, const std::string &, size_t)>;
    using OnStatusChangedCb =
        std::function<void(const std::string &, TransferStatus, const std::string &)>;
    using OnProgressChangedCb = std::function<void(const std::string &, uint64_t, double, double)>;
    using OnChecksumUpdatedCb = std::function<void(const std::string &)>;

    void set_on_transfer_created_cb(OnTransferCreatedCb &&cb);
    void set_on_transfer_queued_cb(OnTransferQueuedCb &&cb);
    void set_on_status_changed_cb(OnStatusChangedCb &&cb);
    void set_on_progress_changed_cb(OnProgressChangedCb &&cb);
    void set_on_checksum_updated_cb(OnChecksumUpdatedCb &&cb);

    // Returns once no callback is running, later notifications are dropped
    void clear_callbacks();

public:  // from TransferObserver
    void on_transfer_created(const std::string &transfer_id) override;
    void on_transfer_queued(
        const std::string &peer, const std::string &file_path, size_t queue_position) override;
    void on_status_changed(const std::string &transfer_id, TransferStatus status,
        const std::string &error) override;
    void on_progress_changed(const std::string &transfer_id, uint64_t bytes_transferred,
        double rate, double eta_seconds) override;
    void on_checksum_updated(const std::string &transfer_id) override;

private:
    std::mutex          mutex_;
    OnTransferCreatedCb on_transfer_created_cb_;
    OnTransferQueuedCb  on_transfer_queued_cb_;
    OnStatusChangedCb   on_status_changed_cb_;
    OnProgressChangedCb on_progress_changed_cb_;
    OnChecksumUpdatedCb on_checksum_updated_cb_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFEROBSERVERDELEGATE_HPP_
