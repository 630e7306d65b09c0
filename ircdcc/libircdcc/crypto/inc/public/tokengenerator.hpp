#ifndef IRCDCC_CRYPTO_TOKENGENERATOR_HPP_
#define IRCDCC_CRYPTO_TOKENGENERATOR_HPP_

#include <cstddef>
#include <string>

namespace ircdcc::crypto
{
class TokenGenerator
{
public:
    virtual ~TokenGenerator() = default;

    // Returns byte_count unpredictable bytes hex encoded
    [[nodiscard]] virtual std::string generate(size_t byte_count) = 0;
};
}  // namespace ircdcc::crypto

#endif  // IRCDCC_CRYPTO_TOKENGENERATOR_HPP_
