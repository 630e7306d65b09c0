#ifndef IRCDCC_DCC_DCCEVENTLISTENER_HPP_
#define IRCDCC_DCC_DCCEVENTLISTENER_HPP_

#include <string>

#include "offerinfo.hpp"
#include "transferinfo.hpp"

namespace ircdcc::dcc
{
// Notified from a single event thread, in the order the events happened
class DCCEventListener
{
public:
    virtual ~DCCEventListener() = default;

    virtual void on_transfer_created(const TransferInfo &info)                       = 0;
    virtual void on_send_queued(
        const std::string &peer, const std::string &file_path, size_t queue_position) = 0;
    virtual void on_status_changed(const TransferInfo &info)                         = 0;
    virtual void on_progress_changed(const TransferInfo &info)                       = 0;
    virtual void on_checksum_updated(const TransferInfo &info)                       = 0;
    virtual void on_offer_received(const OfferInfo &offer)                           = 0;
    virtual void on_offer_rejected(const OfferInfo &offer, const std::string &reason) = 0;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_DCCEVENTLISTENER_HPP_
