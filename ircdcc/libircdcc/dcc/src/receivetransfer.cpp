#include "receivetransfer.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include <glog/logging.h>

#include "partialfile.hpp"

namespace ircdcc::dcc
{
Direction ReceiveTransfer::direction() const
{
    return Direction::RECEIVE;
}

void ReceiveTransfer::move_data()
{
    storage::PartialFile file {params_.local_path, params_.resume_offset};
    if (!file.is_open())
    {
        fail("Cannot open " + params_.local_path + " for writing");
        return;
    }

    std::vector<uint8_t> buffer(std::max<size_t>(params_.buffer_size, 1));
    uint64_t             received    = params_.resume_offset;
    auto                 chunk_start = Clock::now();

    while (received < params_.file_size)
    {
        size_t bytes_read = 0;
        auto   to_read    = size_t(std::min<uint64_t>(buffer.size(), params_.file_size - received));
        auto   ec         = read_some(buffer.data(), to_read, bytes_read);
        if (is_cancelled())
        {
            return;
        }
        if (ec == boost::asio::error::eof)
        {
            fail("Connection closed by peer after " + std::to_string(received) + " of " +
                 std::to_string(params_.file_size) + " bytes");
            return;
        }
        if (ec == boost::asio::error::timed_out)
        {
            fail("No data received within the transfer timeout");
            return;
        }
        if (ec)
        {
            fail("Receive error: " + ec.message());
            return;
        }

        if (!file.write(buffer.data(), bytes_read))
        {
            fail("Cannot write to " + params_.local_path);
            return;
        }
        received += bytes_read;

        // Acknowledgements carry the total byte count modulo 2^32 in network byte order
        auto                   ack = static_cast<uint32_t>(received);
        std::array<uint8_t, 4> ack_bytes {uint8_t(ack >> 24), uint8_t(ack >> 16),
            uint8_t(ack >> 8), uint8_t(ack)};
        ec = write_all(ack_bytes.data(), ack_bytes.size());
        if (is_cancelled())
        {
            return;
        }
        if (ec)
        {
            if (received < params_.file_size)
            {
                fail("Cannot acknowledge received data: " + ec.message());
                return;
            }
            LOG(WARNING) << "Transfer " << params_.id
                         << ": final acknowledgement not delivered: " << ec.message();
        }

        update_progress(received);
        throttle(chunk_start, bytes_read);
        if (is_cancelled())
        {
            return;
        }
    }

    if (!file.commit())
    {
        fail("Cannot flush " + params_.local_path);
        return;
    }

    update_progress(received, true);
    if (!set_status(TransferStatus::COMPLETED))
    {
        return;
    }

    if (checksum_enabled())
    {
        compute_local_checksum();
    }
}
}  // namespace ircdcc::dcc
