#include "sendtransfer.hpp"

#include <algorithm>
#include <array>

#include <glog/logging.h>

#include "sourcefile.hpp"

namespace ircdcc::dcc
{
Direction SendTransfer::direction() const
{
    return Direction::SEND;
}

void SendTransfer::move_data()
{
    storage::SourceFile file {params_.local_path};
    if (!file.is_open())
    {
        fail("Cannot open " + params_.local_path + " for reading");
        return;
    }
    if (file.size() < params_.file_size)
    {
        fail("Source file " + params_.local_path + " shrank to " + std::to_string(file.size()) +
             " bytes");
        return;
    }

    auto     chunk_size  = std::max<size_t>(params_.buffer_size, 1);
    uint64_t sent        = params_.resume_offset;
    auto     chunk_start = Clock::now();

    while (sent < params_.file_size)
    {
        auto chunk = file.chunk(
            sent, size_t(std::min<uint64_t>(chunk_size, params_.file_size - sent)));
        if (chunk.size == 0)
        {
            fail("Cannot read " + params_.local_path + " at offset " + std::to_string(sent));
            return;
        }

        auto ec = write_all(chunk.data, chunk.size);
        if (is_cancelled())
        {
            return;
        }
        if (ec == boost::asio::error::timed_out)
        {
            fail("Peer stopped reading within the transfer timeout");
            return;
        }
        if (ec)
        {
            fail("Send error after " + std::to_string(sent) + " of " +
                 std::to_string(params_.file_size) + " bytes: " + ec.message());
            return;
        }
        sent += chunk.size;

        drain_acks();
        update_progress(sent);
        throttle(chunk_start, chunk.size);
        if (is_cancelled())
        {
            return;
        }
    }

    update_progress(sent, true);
    wait_for_final_ack();
    if (is_cancelled())
    {
        return;
    }

    if (!set_status(TransferStatus::COMPLETED))
    {
        return;
    }

    // The receiver verifies against the value announced with DCCCHECKSUM
    if (checksum_enabled())
    {
        compute_local_checksum();
    }
}

void SendTransfer::drain_acks()
{
    boost::system::error_code ec;
    for (auto available = socket_.available(ec); !ec && available != 0;
         available      = socket_.available(ec))
    {
        std::array<uint8_t, 64> data;
        auto n = socket_.read_some(
            boost::asio::buffer(data.data(), std::min(available, data.size())), ec);
        if (ec)
        {
            break;
        }
        consume_ack_bytes(data.data(), n);
    }
}

void SendTransfer::consume_ack_bytes(const uint8_t *data, size_t size)
{
    for (size_t i = 0; i != size; ++i)
    {
        ack_buffer_[ack_fill_++] = data[i];
        if (ack_fill_ == ack_buffer_.size())
        {
            last_ack_ = (uint32_t(ack_buffer_[0]) << 24) | (uint32_t(ack_buffer_[1]) << 16) |
                        (uint32_t(ack_buffer_[2]) << 8) | uint32_t(ack_buffer_[3]);
            ack_fill_ = 0;
        }
    }
}

void SendTransfer::wait_for_final_ack()
{
    auto expected = static_cast<uint32_t>(params_.file_size);

    while (last_ack_ != expected)
    {
        std::array<uint8_t, 64> data;
        size_t                  n  = 0;
        auto                    ec = read_some(data.data(), data.size(), n);
        if (is_cancelled())
        {
            return;
        }
        if (ec == boost::asio::error::eof)
        {
            LOG(INFO) << "Transfer " << params_.id
                      << ": peer closed the connection after the last byte";
            return;
        }
        if (ec)
        {
            LOG(WARNING) << "Transfer " << params_.id
                         << ": no final acknowledgement from peer: " << ec.message();
            return;
        }
        consume_ack_bytes(data.data(), n);
    }
}
}  // namespace ircdcc::dcc
