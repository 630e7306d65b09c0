#ifndef IRCDCC_CRYPTO_CHECKSUMCALCULATORIMPL_HPP_
#define IRCDCC_CRYPTO_CHECKSUMCALCULATORIMPL_HPP_

#include <vector>

#include <glog/logging.h>
#include <openssl/evp.h>

#include "checksumcalculator.hpp"

namespace ircdcc::crypto
{
class ChecksumCalculatorImpl : public ChecksumCalculator
{
public:
    [[nodiscard]] bool is_supported(const std::string &algorithm) const override;
    bool hash(const std::string &algorithm, const Byte *data, size_t len,
        std::string &hex_digest) const override;
    bool hash(
        const std::string &algorithm, InputStream &is, std::string &hex_digest) const override;
    bool hash_file(const std::string &algorithm, const std::string &file_path,
        std::string &hex_digest) const override;

private:
    [[nodiscard]] static const EVP_MD *digest_by_name(const std::string &algorithm);

    // Feeds the digest from a reader that fills the buffer and returns the number of bytes read,
    // 0 once the input is exhausted
    template<typename Reader>
    static std::vector<Byte> hash(const EVP_MD *algorithm, Reader &&read_chunk,
        size_t buffer_size = DEFAULT_BUFFER_SIZE)
    {
        std::vector<Byte> buffer(buffer_size);
        std::vector<Byte> digest(EVP_MAX_MD_SIZE);
        unsigned int      digest_length = 0;

        auto ctx = EVP_MD_CTX_new();
        if (!ctx)
        {
            LOG(FATAL) << "EVP_MD_CTX_new failed";
        }

        if (!EVP_DigestInit_ex(ctx, algorithm, nullptr))
        {
            LOG(FATAL) << "EVP_DigestInit_ex failed";
        }

        for (size_t cnt; (cnt = read_chunk(buffer.data(), buffer.size())) != 0;)
        {
            if (!EVP_DigestUpdate(ctx, buffer.data(), cnt))
            {
                LOG(FATAL) << "EVP_DigestUpdate failed";
            }
        }

        if (!EVP_DigestFinal_ex(ctx, digest.data(), &digest_length))
        {
            LOG(FATAL) << "EVP_DigestFinal_ex failed";
        }

        EVP_MD_CTX_free(ctx);

        digest.resize(digest_length);
        return digest;
    }

    static constexpr size_t DEFAULT_BUFFER_SIZE = 32 * 1024;  // 32 KiB
};
}  // namespace ircdcc::crypto

#endif  // IRCDCC_CRYPTO_CHECKSUMCALCULATORIMPL_HPP_
