#ifndef IRCDCC_CRYPTO_TOKENGENERATORIMPL_HPP_
#define IRCDCC_CRYPTO_TOKENGENERATORIMPL_HPP_

#include "tokengenerator.hpp"

namespace ircdcc::crypto
{
class TokenGeneratorImpl : public TokenGenerator
{
public:
    [[nodiscard]] std::string generate(size_t byte_count) override;
};
}  // namespace ircdcc::crypto

#endif  // IRCDCC_CRYPTO_TOKENGENERATORIMPL_HPP_
