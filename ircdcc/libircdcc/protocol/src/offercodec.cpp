#include "offercodec.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <glog/logging.h>

#include "address.hpp"
#include "hexencoding.hpp"

namespace ircdcc::protocol
{
namespace
{
constexpr char ctcp_marker = '\x01';

bool is_number(const std::string &str)
{
    return !str.empty() && std::all_of(str.cbegin(), str.cend(),
                               [](unsigned char c) { return std::isdigit(c); });
}

bool parse_number(const std::string &str, uint64_t max, uint64_t &value)
{
    if (!is_number(str))
    {
        return false;
    }

    uint64_t result = 0;
    for (char c : str)
    {
        auto digit = uint64_t(c - '0');
        if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10)
        {
            return false;
        }
        result = result * 10 + digit;
    }

    if (result > max)
    {
        return false;
    }
    value = result;
    return true;
}

bool parse_port(const std::string &str, bool allow_zero, Port &port)
{
    uint64_t value;
    if (!parse_number(str, std::numeric_limits<Port>::max(), value) || (!allow_zero && value == 0))
    {
        return false;
    }
    port = Port(value);
    return true;
}

bool parse_ip(const std::string &str, std::string &ip)
{
    network::IPv4Address address;
    if (!network::conversion::parse_ipv4_address(str, address))
    {
        return false;
    }
    ip = network::conversion::to_string(address);
    return true;
}

// Numbers that fit a port are never taken for an advertised host, 0.0.0.0/16 is not routable
bool looks_like_ip(const std::string &str)
{
    uint64_t value;
    if (is_number(str))
    {
        return parse_number(str, std::numeric_limits<network::IPv4Address>::max(), value) &&
               value > std::numeric_limits<Port>::max();
    }
    std::string ip;
    return parse_ip(str, ip);
}

// Trailing fields of a resume style command, "port position" or "port position token"
size_t resume_field_count(size_t argument_count, bool quoted, const std::string &third_last)
{
    size_t rest = argument_count - 1;
    if (quoted)
    {
        return rest;
    }
    return rest >= 3 && is_number(third_last) ? 3 : 2;
}

std::string ip_to_wire(const std::string &ip)
{
    network::IPv4Address address = 0;
    if (!ip.empty() && !network::conversion::parse_ipv4_address(ip, address))
    {
        LOG(WARNING) << "Cannot encode ip " << ip << ", advertising 0";
    }
    return std::to_string(address);
}
}  // namespace

bool OfferCodec::parse(const std::string &payload, Offer &offer, std::string &error) const
{
    std::string text;
    text.reserve(payload.size());
    std::copy_if(payload.cbegin(), payload.cend(), std::back_inserter(text),
        [](char c) { return c != ctcp_marker; });

    auto tokens = tokenize(text);
    if (tokens.empty() || !boost::algorithm::iequals(tokens[0].text, "DCC"))
    {
        error = "Not a DCC payload";
        return false;
    }
    if (tokens.size() < 2)
    {
        error = "Missing DCC sub-command";
        return false;
    }

    auto      command = boost::algorithm::to_upper_copy(tokens[1].text);
    Arguments args(tokens.begin() + 2, tokens.end());

    if (command == "SEND")
    {
        return parse_send(args, offer, error);
    }
    if (command == "ACCEPT")
    {
        return parse_accept(args, offer, error);
    }
    if (command == "RESUME")
    {
        return parse_resume(args, offer, error);
    }
    if (command == "DCCCHECKSUM")
    {
        return parse_checksum(args, offer, error);
    }

    error = "Unsupported DCC sub-command " + command;
    return false;
}

bool OfferCodec::parse_send(const Arguments &args, Offer &offer, std::string &error) const
{
    size_t n = args.size();
    if (n < 4)
    {
        error = "DCC SEND has too few arguments";
        return false;
    }

    std::string ip;
    bool        passive = n >= 5 && args[n - 3].text == "0" && parse_ip(args[n - 4].text, ip);
    size_t      fixed   = passive ? 4 : 3;

    if (args[0].quoted ? n != fixed + 1 : n <= fixed)
    {
        error = "DCC SEND has an unexpected number of arguments";
        return false;
    }

    SendOffer send;
    send.filename = join_filename(args, n - fixed);
    if (send.filename.empty())
    {
        error = "DCC SEND has an empty filename";
        return false;
    }

    if (!parse_ip(args[n - fixed].text, send.ip))
    {
        error = "DCC SEND has an invalid ip " + args[n - fixed].text;
        return false;
    }

    if (!parse_port(args[n - fixed + 1].text, passive, send.port))
    {
        error = "DCC SEND has an invalid port " + args[n - fixed + 1].text;
        return false;
    }

    if (!parse_number(args[n - fixed + 2].text, std::numeric_limits<FileSize>::max(),
            send.file_size))
    {
        error = "DCC SEND has an invalid file size " + args[n - fixed + 2].text;
        return false;
    }

    if (passive)
    {
        send.token = args[n - 1].text;
    }

    offer = std::move(send);
    return true;
}

bool OfferCodec::parse_accept(const Arguments &args, Offer &offer, std::string &error) const
{
    size_t n = args.size();
    if (n < 3)
    {
        error = "DCC ACCEPT has too few arguments";
        return false;
    }

    // The form follows the shape of the trailing fields: an address in front of
    // "port position [token]" makes an active or passive accept, anything else is a resume accept
    bool quoted    = args[0].quoted;
    auto has_ip_at = [&](size_t fields) {
        return n - 1 >= fields && (!quoted || n - 1 == fields) &&
               looks_like_ip(args[n - fields].text);
    };

    AcceptOffer accept;
    size_t      rest;
    if (has_ip_at(4))
    {
        accept.kind = AcceptOffer::Kind::PASSIVE;
        rest        = 4;
    }
    else if (has_ip_at(3))
    {
        accept.kind = AcceptOffer::Kind::ACTIVE;
        rest        = 3;
    }
    else
    {
        accept.kind = AcceptOffer::Kind::RESUME;
        rest        = resume_field_count(n, quoted, args[n - 3].text);
    }
    if (rest < 2 || rest > 4 || (accept.kind == AcceptOffer::Kind::RESUME && rest > 3))
    {
        error = "DCC ACCEPT has an unexpected number of arguments";
        return false;
    }

    accept.filename = join_filename(args, n - rest);
    if (accept.filename.empty())
    {
        error = "DCC ACCEPT has an empty filename";
        return false;
    }

    size_t first = n - rest;
    if (accept.kind == AcceptOffer::Kind::RESUME)
    {
        if (!parse_port(args[first].text, true, accept.port))
        {
            error = "DCC ACCEPT has an invalid port " + args[first].text;
            return false;
        }
        if (!parse_number(
                args[first + 1].text, std::numeric_limits<FileSize>::max(), accept.position))
        {
            error = "DCC ACCEPT has an invalid position " + args[first + 1].text;
            return false;
        }
        if (rest == 3)
        {
            accept.token = args[n - 1].text;
        }
    }
    else
    {
        if (!parse_ip(args[first].text, accept.ip))
        {
            error = "DCC ACCEPT has an invalid ip " + args[first].text;
            return false;
        }
        if (!parse_port(args[first + 1].text, false, accept.port))
        {
            error = "DCC ACCEPT has an invalid port " + args[first + 1].text;
            return false;
        }
        if (!parse_number(
                args[first + 2].text, std::numeric_limits<FileSize>::max(), accept.position))
        {
            error = "DCC ACCEPT has an invalid position " + args[first + 2].text;
            return false;
        }
        if (rest == 4)
        {
            accept.token = args[n - 1].text;
        }
    }

    offer = std::move(accept);
    return true;
}

bool OfferCodec::parse_resume(const Arguments &args, Offer &offer, std::string &error) const
{
    size_t n = args.size();
    if (n < 3)
    {
        error = "DCC RESUME has too few arguments";
        return false;
    }

    size_t rest = resume_field_count(n, args[0].quoted, args[n - 3].text);
    if (rest < 2 || rest > 3)
    {
        error = "DCC RESUME has an unexpected number of arguments";
        return false;
    }

    ResumeOffer resume;
    resume.filename = join_filename(args, n - rest);
    if (resume.filename.empty())
    {
        error = "DCC RESUME has an empty filename";
        return false;
    }

    size_t first = n - rest;
    if (!parse_port(args[first].text, true, resume.port))
    {
        error = "DCC RESUME has an invalid port " + args[first].text;
        return false;
    }
    if (!parse_number(
            args[first + 1].text, std::numeric_limits<FileSize>::max(), resume.position))
    {
        error = "DCC RESUME has an invalid position " + args[first + 1].text;
        return false;
    }
    if (rest == 3)
    {
        resume.token = args[n - 1].text;
    }

    offer = std::move(resume);
    return true;
}

bool OfferCodec::parse_checksum(const Arguments &args, Offer &offer, std::string &error) const
{
    size_t n = args.size();
    if (n < 4 || (args[1].quoted && n != 4))
    {
        error = "DCC DCCCHECKSUM has an unexpected number of arguments";
        return false;
    }

    ChecksumOffer checksum;
    checksum.transfer_id = args[0].text;

    Arguments filename_args(args.begin() + 1, args.end() - 2);
    checksum.filename  = join_filename(filename_args, filename_args.size());
    checksum.algorithm = args[n - 2].text;
    checksum.value     = args[n - 1].text;

    if (checksum.transfer_id.empty() || checksum.filename.empty() || checksum.algorithm.empty())
    {
        error = "DCC DCCCHECKSUM has empty fields";
        return false;
    }
    if (!crypto::is_hex(checksum.value))
    {
        error = "DCC DCCCHECKSUM has an invalid checksum value " + checksum.value;
        return false;
    }

    offer = std::move(checksum);
    return true;
}

std::string OfferCodec::format(const Offer &offer) const
{
    return std::visit([this](const auto &o) { return format(o); }, offer);
}

std::string OfferCodec::format(const SendOffer &offer) const
{
    std::ostringstream ss;
    ss << "DCC SEND " << quote_filename(offer.filename) << ' ' << ip_to_wire(offer.ip) << ' '
       << offer.port << ' ' << offer.file_size;
    if (!offer.token.empty())
    {
        ss << ' ' << offer.token;
    }
    return ss.str();
}

std::string OfferCodec::format(const AcceptOffer &offer) const
{
    std::ostringstream ss;
    ss << "DCC ACCEPT " << quote_filename(offer.filename) << ' ';
    if (offer.kind != AcceptOffer::Kind::RESUME)
    {
        auto ip = ip_to_wire(offer.ip);
        LOG_IF(WARNING, !looks_like_ip(ip))
            << "DCC ACCEPT advertises " << offer.ip << ", peers will read it as a resume accept";
        ss << ip << ' ';
    }
    ss << offer.port << ' ' << offer.position;
    if (offer.kind != AcceptOffer::Kind::ACTIVE && !offer.token.empty())
    {
        ss << ' ' << offer.token;
    }
    return ss.str();
}

std::string OfferCodec::format(const ResumeOffer &offer) const
{
    std::ostringstream ss;
    ss << "DCC RESUME " << quote_filename(offer.filename) << ' ' << offer.port << ' '
       << offer.position;
    if (!offer.token.empty())
    {
        ss << ' ' << offer.token;
    }
    return ss.str();
}

std::string OfferCodec::format(const ChecksumOffer &offer) const
{
    std::ostringstream ss;
    ss << "DCC DCCCHECKSUM " << offer.transfer_id << ' ' << quote_filename(offer.filename) << ' '
       << offer.algorithm << ' ' << offer.value;
    return ss.str();
}

OfferCodec::Arguments OfferCodec::tokenize(const std::string &text)
{
    Arguments args;
    size_t    i = 0;
    while (i < text.size())
    {
        if (std::isspace(static_cast<unsigned char>(text[i])))
        {
            ++i;
            continue;
        }

        if (text[i] == '"')
        {
            auto end = text.find('"', i + 1);
            if (end == std::string::npos)
            {
                end = text.size();
            }
            args.push_back({text.substr(i + 1, end - i - 1), true});
            i = end + 1;
            continue;
        }

        size_t end = i;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
        {
            ++end;
        }
        args.push_back({text.substr(i, end - i), false});
        i = end;
    }
    return args;
}

std::string OfferCodec::join_filename(const Arguments &args, size_t count)
{
    if (count == 0 || args.empty())
    {
        return {};
    }
    if (args[0].quoted)
    {
        return args[0].text;
    }

    std::string filename;
    for (size_t i = 0; i != count && i != args.size(); ++i)
    {
        if (i != 0)
        {
            filename += ' ';
        }
        filename += args[i].text;
    }
    return filename;
}

std::string OfferCodec::quote_filename(const std::string &filename)
{
    if (filename.find(' ') == std::string::npos)
    {
        return filename;
    }
    return '"' + filename + '"';
}
}  // namespace ircdcc::protocol
