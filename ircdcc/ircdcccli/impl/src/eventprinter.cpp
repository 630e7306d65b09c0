#include "eventprinter.hpp"

#include "offerinfo.hpp"
#include "transferinfo.hpp"

namespace ircdcccli
{
using namespace ircdcc::dcc;

EventPrinter::EventPrinter(std::ostream &output_stream, int print_timeout_ms)
    : output_stream_ {output_stream}
    , print_timeout_ {print_timeout_ms}
{}

void EventPrinter::on_transfer_created(const TransferInfo &info)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[dcc] New " << to_string(info.direction) << " transfer "
                   << info.id.substr(0, 8) << ": '" << info.filename << "' ("
                   << size_formatter_.format(info.file_size) << ") "
                   << (info.direction == Direction::SEND ? "to " : "from ") << info.peer << '\n';
}

void EventPrinter::on_send_queued(
    const std::string &peer, const std::string &file_path, size_t queue_position)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[dcc] " << file_path << " queued for " << peer << " at position "
                   << queue_position << '\n';
}

void EventPrinter::on_status_changed(const TransferInfo &info)
{
    std::lock_guard lock {mutex_};
    if (is_terminal(info.status))
    {
        latest_print_tps_.erase(info.id);
    }
    output_stream_ << "[dcc] " << info.id.substr(0, 8) << " '" << info.filename << "' is now "
                   << to_string(info.status);
    if (!info.error.empty())
    {
        output_stream_ << ": " << info.error;
    }
    output_stream_ << '\n';
}

void EventPrinter::on_progress_changed(const TransferInfo &info)
{
    std::lock_guard lock {mutex_};

    auto  now          = Clock::now();
    auto &latest_print = latest_print_tps_[info.id];
    bool  first_update = latest_print.time_since_epoch().count() == 0;
    bool  done         = info.bytes_transferred == info.file_size;

    if (!first_update && !done && now - latest_print < print_timeout_)
    {
        return;
    }
    latest_print = now;

    auto progress_percentage =
        info.file_size == 0 ? 100 : 100 * info.bytes_transferred / info.file_size;

    output_stream_ << "[dcc] " << info.id.substr(0, 8) << ' ' << progress_percentage << "% - "
                   << size_formatter_.format(info.bytes_transferred) << " / "
                   << size_formatter_.format(info.file_size);
    if (info.rate > 0)
    {
        output_stream_ << " - " << size_formatter_.format(static_cast<uint64_t>(info.rate))
                       << "/s";
    }
    output_stream_ << '\n';
}

void EventPrinter::on_checksum_updated(const TransferInfo &info)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[dcc] " << info.id.substr(0, 8) << " '" << info.filename
                   << "' checksum: " << to_string(info.checksum_status);
    if (!info.local_checksum.empty())
    {
        output_stream_ << " (" << info.checksum_algorithm << ' ' << info.local_checksum << ')';
    }
    output_stream_ << '\n';
}

void EventPrinter::on_offer_received(const OfferInfo &offer)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[dcc] " << offer.nick << " (" << offer.userhost << ") offers '"
                   << offer.filename << "' (" << size_formatter_.format(offer.file_size) << ")";
    if (offer.resume)
    {
        output_stream_ << ", resuming from " << size_formatter_.format(offer.position);
    }
    if (offer.passive)
    {
        output_stream_ << ". Use: get " << offer.token;
    }
    else if (!offer.transfer_id.empty())
    {
        output_stream_ << ". Use: confirm " << offer.transfer_id.substr(0, 8);
    }
    output_stream_ << '\n';
}

void EventPrinter::on_offer_rejected(const OfferInfo &offer, const std::string &reason)
{
    std::lock_guard lock {mutex_};
    output_stream_ << "[dcc] Rejected '" << offer.filename << "' from " << offer.nick << ": "
                   << reason << '\n';
}
}  // namespace ircdcccli
