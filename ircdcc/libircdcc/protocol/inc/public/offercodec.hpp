#ifndef IRCDCC_PROTOCOL_OFFERCODEC_HPP_
#define IRCDCC_PROTOCOL_OFFERCODEC_HPP_

#include <string>
#include <vector>

#include "offers.hpp"

namespace ircdcc::protocol
{
// Converts between CTCP DCC payloads and offers. The formatted text carries no \x01 markers.
class OfferCodec
{
public:
    bool parse(const std::string &payload, Offer &offer, std::string &error) const;

    [[nodiscard]] std::string format(const Offer &offer) const;
    [[nodiscard]] std::string format(const SendOffer &offer) const;
    [[nodiscard]] std::string format(const AcceptOffer &offer) const;
    [[nodiscard]] std::string format(const ResumeOffer &offer) const;
    [[nodiscard]] std::string format(const ChecksumOffer &offer) const;

private:
    struct Argument
    {
        std::string text;
        bool        quoted;
    };
    using Arguments = std::vector<Argument>;

    static Arguments tokenize(const std::string &text);
    static std::string join_filename(const Arguments &args, size_t count);
    static std::string quote_filename(const std::string &filename);

    bool parse_send(const Arguments &args, Offer &offer, std::string &error) const;
    bool parse_accept(const Arguments &args, Offer &offer, std::string &error) const;
    bool parse_resume(const Arguments &args, Offer &offer, std::string &error) const;
    bool parse_checksum(const Arguments &args, Offer &offer, std::string &error) const;
};
}  // namespace ircdcc::protocol

#endif  // IRCDCC_PROTOCOL_OFFERCODEC_HPP_
