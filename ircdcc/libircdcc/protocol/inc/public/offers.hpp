#ifndef IRCDCC_PROTOCOL_OFFERS_HPP_
#define IRCDCC_PROTOCOL_OFFERS_HPP_

#include <cstdint>
#include <string>
#include <variant>

namespace ircdcc::protocol
{
using Port     = uint16_t;
using FileSize = uint64_t;

// DCC SEND <filename> <ip> <port> <size> [token]
struct SendOffer
{
    std::string filename;
    std::string ip;  // Canonical dotted quad
    Port        port      = 0;
    FileSize    file_size = 0;
    std::string token;  // Non-empty only for passive offers

    [[nodiscard]] bool is_passive() const
    {
        return port == 0 && !token.empty();
    }
};

// DCC ACCEPT, reply to a passive SEND (PASSIVE), to a RESUME (RESUME) or a plain
// acknowledgement of an active SEND (ACTIVE)
struct AcceptOffer
{
    enum class Kind
    {
        ACTIVE,
        PASSIVE,
        RESUME
    };

    Kind        kind = Kind::ACTIVE;
    std::string filename;
    std::string ip;  // Empty for RESUME
    Port        port     = 0;
    FileSize    position = 0;
    std::string token;
};

// DCC RESUME <filename> <port> <position> [token]
struct ResumeOffer
{
    std::string filename;
    Port        port     = 0;
    FileSize    position = 0;
    std::string token;
};

// DCC DCCCHECKSUM <transfer-id> <filename> <algorithm> <hex>
struct ChecksumOffer
{
    std::string transfer_id;
    std::string filename;
    std::string algorithm;
    std::string value;
};

using Offer = std::variant<SendOffer, AcceptOffer, ResumeOffer, ChecksumOffer>;

inline bool operator==(const SendOffer &lhs, const SendOffer &rhs)
{
    return lhs.filename == rhs.filename && lhs.ip == rhs.ip && lhs.port == rhs.port &&
           lhs.file_size == rhs.file_size && lhs.token == rhs.token;
}

inline bool operator==(const AcceptOffer &lhs, const AcceptOffer &rhs)
{
    return lhs.kind == rhs.kind && lhs.filename == rhs.filename && lhs.ip == rhs.ip &&
           lhs.port == rhs.port && lhs.position == rhs.position && lhs.token == rhs.token;
}

inline bool operator==(const ResumeOffer &lhs, const ResumeOffer &rhs)
{
    return lhs.filename == rhs.filename && lhs.port == rhs.port &&
           lhs.position == rhs.position && lhs.token == rhs.token;
}

inline bool operator==(const ChecksumOffer &lhs, const ChecksumOffer &rhs)
{
    return lhs.transfer_id == rhs.transfer_id && lhs.filename == rhs.filename &&
           lhs.algorithm == rhs.algorithm && lhs.value == rhs.value;
}
}  // namespace ircdcc::protocol

#endif  // IRCDCC_PROTOCOL_OFFERS_HPP_
