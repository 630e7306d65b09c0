#include "tokengeneratorimpl.hpp"

#include <vector>

#include <glog/logging.h>
#include <openssl/rand.h>

#include "hexencoding.hpp"

namespace ircdcc::crypto
{
std::string TokenGeneratorImpl::generate(size_t byte_count)
{
    std::vector<uint8_t> bytes(byte_count);
    if (RAND_bytes(bytes.data(), int(bytes.size())) != 1)
    {
        LOG(FATAL) << "RAND_bytes failed";
    }
    return to_hex(bytes.data(), bytes.size());
}
}  // namespace ircdcc::crypto
