#ifndef IRCDCC_DCC_CHECKSUMVERIFICATION_HPP_
#define IRCDCC_DCC_CHECKSUMVERIFICATION_HPP_

#include <string>

#include "transferstatus.hpp"

namespace ircdcc::dcc
{
// Compares the sender's announced checksum with the locally computed one. Either value may
// arrive first. Not thread safe, the owning transfer serializes access.
class ChecksumVerification
{
public:
    ChecksumVerification(bool enabled, std::string algorithm);

    // Each returns true when the status changed
    bool set_expected(const std::string &algorithm, const std::string &value);
    bool set_local(const std::string &value);
    bool set_local_error(const std::string &reason);

    [[nodiscard]] bool               enabled() const;
    [[nodiscard]] ChecksumStatus     status() const;
    [[nodiscard]] const std::string &algorithm() const;
    [[nodiscard]] const std::string &expected() const;
    [[nodiscard]] const std::string &local() const;
    [[nodiscard]] const std::string &error() const;

private:
    bool update();

    const bool     enabled_;
    std::string    algorithm_;
    std::string    expected_algorithm_;
    std::string    expected_;
    std::string    local_;
    std::string    error_;
    bool           local_done_;
    ChecksumStatus status_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_CHECKSUMVERIFICATION_HPP_
