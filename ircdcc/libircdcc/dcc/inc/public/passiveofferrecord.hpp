#ifndef IRCDCC_DCC_PASSIVEOFFERRECORD_HPP_
#define IRCDCC_DCC_PASSIVEOFFERRECORD_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace ircdcc::dcc
{
// A reverse DCC SEND waiting for the user to fetch it with its token
struct PassiveOfferRecord
{
    std::string                           token;
    std::string                           nick;
    std::string                           filename;
    uint64_t                              file_size = 0;
    std::string                           ip;
    std::string                           userhost;
    std::chrono::steady_clock::time_point created_at;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_PASSIVEOFFERRECORD_HPP_
