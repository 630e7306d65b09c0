#include "transferobserverdelegate.hpp"

#include <utility>

namespace ircdcc::dcc
{
void TransferObserverDelegate::set_on_transfer_created_cb(OnTransferCreatedCb &&cb)
{
    std::lock_guard lock {mutex_};
    on_transfer_created_cb_ = std::move(cb);
}

void TransferObserverDelegate::set_on_transfer_queued_cb(OnTransferQueuedCb &&cb)
{
    std::lock_guard lock {mutex_};
    on_transfer_queued_cb_ = std::move(cb);
}

void TransferObserverDelegate::set_on_status_changed_cb(OnStatusChangedCb &&cb)
{
    std::lock_guard lock {mutex_};
    on_status_changed_cb_ = std::move(cb);
}

void TransferObserverDelegate::set_on_progress_changed_cb(OnProgressChangedCb &&cb)
{
    std::lock_guard lock {mutex_};
    on_progress_changed_cb_ = std::move(cb);
}

void TransferObserverDelegate::set_on_checksum_updated_cb(OnChecksumUpdatedCb &&cb)
{
    std::lock_guard lock {mutex_};
    on_checksum_updated_cb_ = std::move(cb);
}

void TransferObserverDelegate::clear_callbacks()
{
    std::lock_guard lock {mutex_};
    on_transfer_created_cb_ = nullptr;
    on_transfer_queued_cb_  = nullptr;
    on_status_changed_cb_   = nullptr;
    on_progress_changed_cb_ = nullptr;
    on_checksum_updated_cb_ = nullptr;
}

void TransferObserverDelegate::on_transfer_created(const std::string &transfer_id)
{
    std::lock_guard lock {mutex_};
    if (on_transfer_created_cb_)
    {
        on_transfer_created_cb_(transfer_id);
    }
}

void TransferObserverDelegate::on_transfer_queued(
    const std::string &peer, const std::string &file_path, size_t queue_position)
{
    std::lock_guard lock {mutex_};
    if (on_transfer_queued_cb_)
    {
        on_transfer_queued_cb_(peer, file_path, queue_position);
    }
}

void TransferObserverDelegate::on_status_changed(
    const std::string &transfer_id, TransferStatus status, const std::string &error)
{
    std::lock_guard lock {mutex_};
    if (on_status_changed_cb_)
    {
        on_status_changed_cb_(transfer_id, status, error);
    }
}

void TransferObserverDelegate::on_progress_changed(
    const std::string &transfer_id, uint64_t bytes_transferred, double rate, double eta_seconds)
{
    std::lock_guard lock {mutex_};
    if (on_progress_changed_cb_)
    {
        on_progress_changed_cb_(transfer_id, bytes_transferred, rate, eta_seconds);
    }
}

void TransferObserverDelegate::on_checksum_updated(const std::string &transfer_id)
{
    std::lock_guard lock {mutex_};
    if (on_checksum_updated_cb_)
    {
        on_checksum_updated_cb_(transfer_id);
    }
}
}  // namespace ircdcc::dcc
