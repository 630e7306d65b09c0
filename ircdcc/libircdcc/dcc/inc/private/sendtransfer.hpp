#ifndef IRCDCC_DCC_SENDTRANSFER_HPP_
#define IRCDCC_DCC_SENDTRANSFER_HPP_

#include <array>

#include "transfer.hpp"

namespace ircdcc::dcc
{
class SendTransfer : public Transfer
{
public:
    using Transfer::Transfer;

    [[nodiscard]] Direction direction() const override;

protected:
    void move_data() override;

private:
    // Consumes the acknowledgements that already arrived without blocking
    void drain_acks();
    void consume_ack_bytes(const uint8_t *data, size_t size);

    // Waits for the acknowledgement of the whole file or for the peer to hang up
    void wait_for_final_ack();

    std::array<uint8_t, 4> ack_buffer_ {};
    size_t                 ack_fill_ = 0;
    uint32_t               last_ack_ = 0;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_SENDTRANSFER_HPP_
