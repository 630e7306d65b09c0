#ifndef IRCDCC_CRYPTO_HEXENCODING_HPP_
#define IRCDCC_CRYPTO_HEXENCODING_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace ircdcc::crypto
{
std::string to_hex(const uint8_t *data, size_t len);
bool        is_hex(const std::string &str);
}  // namespace ircdcc::crypto

#endif  // IRCDCC_CRYPTO_HEXENCODING_HPP_
