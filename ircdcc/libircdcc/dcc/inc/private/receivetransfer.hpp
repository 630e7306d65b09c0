#ifndef IRCDCC_DCC_RECEIVETRANSFER_HPP_
#define IRCDCC_DCC_RECEIVETRANSFER_HPP_

#include "transfer.hpp"

namespace ircdcc::dcc
{
// Appends incoming data to the local file starting at the resume offset and acknowledges every
// chunk with the total byte count
class ReceiveTransfer : public Transfer
{
public:
    using Transfer::Transfer;

    [[nodiscard]] Direction direction() const override;

protected:
    void move_data() override;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_RECEIVETRANSFER_HPP_
