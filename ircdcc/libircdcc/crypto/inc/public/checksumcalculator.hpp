#ifndef IRCDCC_CRYPTO_CHECKSUMCALCULATOR_HPP_
#define IRCDCC_CRYPTO_CHECKSUMCALCULATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace ircdcc::crypto
{
// Digests are identified by name ("md5", "sha1", "sha256", ...) and returned as lowercase hex
class ChecksumCalculator
{
public:
    using Byte        = uint8_t;
    using InputStream = std::istream;

    virtual ~ChecksumCalculator() = default;

    [[nodiscard]] virtual bool is_supported(const std::string &algorithm) const = 0;
    virtual bool               hash(const std::string &algorithm, const Byte *data, size_t len,
                      std::string &hex_digest) const                             = 0;
    virtual bool               hash(const std::string &algorithm, InputStream &is,
                      std::string &hex_digest) const                             = 0;
    virtual bool               hash_file(const std::string &algorithm, const std::string &file_path,
                      std::string &hex_digest) const                             = 0;
};
}  // namespace ircdcc::crypto

#endif  // IRCDCC_CRYPTO_CHECKSUMCALCULATOR_HPP_
