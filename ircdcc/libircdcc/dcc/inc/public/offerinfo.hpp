#ifndef IRCDCC_DCC_OFFERINFO_HPP_
#define IRCDCC_DCC_OFFERINFO_HPP_

#include <cstdint>
#include <string>

namespace ircdcc::dcc
{
// An incoming SEND or RESUME offer as presented to the user
struct OfferInfo
{
    std::string    nick;
    std::string    userhost;
    std::string    filename;
    uint64_t       file_size = 0;
    std::string    ip;
    unsigned short port    = 0;
    bool           passive = false;
    std::string    token;  // Passive offers, "get <token>" accepts them
    bool           resume   = false;
    uint64_t       position = 0;
    std::string    transfer_id;  // Set when the offer created a transfer
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_OFFERINFO_HPP_
