#ifndef IRCDCCCLI_EVENTPRINTER_HPP_
#define IRCDCCCLI_EVENTPRINTER_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

#include "datasizeformatter.hpp"
#include "dcceventlistener.hpp"

namespace ircdcccli
{
class EventPrinter : public ircdcc::dcc::DCCEventListener
{
public:
    // Progress of a transfer is printed at most once per print_timeout_ms
    EventPrinter(std::ostream &output_stream, int print_timeout_ms);

    void on_transfer_created(const ircdcc::dcc::TransferInfo &info) override;
    void on_send_queued(
        const std::string &peer, const std::string &file_path, size_t queue_position) override;
    void on_status_changed(const ircdcc::dcc::TransferInfo &info) override;
    void on_progress_changed(const ircdcc::dcc::TransferInfo &info) override;
    void on_checksum_updated(const ircdcc::dcc::TransferInfo &info) override;
    void on_offer_received(const ircdcc::dcc::OfferInfo &offer) override;
    void on_offer_rejected(
        const ircdcc::dcc::OfferInfo &offer, const std::string &reason) override;

private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    std::ostream &                   output_stream_;
    std::chrono::milliseconds        print_timeout_;
    std::map<std::string, TimePoint> latest_print_tps_;
    DataSizeFormatter                size_formatter_;
    std::mutex                       mutex_;
};
}  // namespace ircdcccli

#endif  // IRCDCCCLI_EVENTPRINTER_HPP_
