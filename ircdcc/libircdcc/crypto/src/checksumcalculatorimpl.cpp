#include "checksumcalculatorimpl.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>

#include "hexencoding.hpp"

namespace ircdcc::crypto
{
bool ChecksumCalculatorImpl::is_supported(const std::string &algorithm) const
{
    return digest_by_name(algorithm) != nullptr;
}

bool ChecksumCalculatorImpl::hash(
    const std::string &algorithm, const Byte *data, size_t len, std::string &hex_digest) const
{
    auto md = digest_by_name(algorithm);
    if (!md)
    {
        LOG(ERROR) << "Unsupported checksum algorithm " << algorithm;
        return false;
    }

    size_t offset = 0;
    auto   digest = hash(md, [&](Byte *out, size_t capacity) {
        size_t cnt = std::min(capacity, len - offset);
        std::memcpy(out, data + offset, cnt);
        offset += cnt;
        return cnt;
    });

    hex_digest = to_hex(digest.data(), digest.size());
    return true;
}

bool ChecksumCalculatorImpl::hash(
    const std::string &algorithm, InputStream &is, std::string &hex_digest) const
{
    auto md = digest_by_name(algorithm);
    if (!md)
    {
        LOG(ERROR) << "Unsupported checksum algorithm " << algorithm;
        return false;
    }

    auto digest = hash(md, [&](Byte *out, size_t capacity) {
        is.read(reinterpret_cast<char *>(out), std::streamsize(capacity));
        return size_t(is.gcount());
    });

    if (is.bad())
    {
        LOG(ERROR) << "Input stream failure while computing " << algorithm << " checksum";
        return false;
    }

    hex_digest = to_hex(digest.data(), digest.size());
    return true;
}

bool ChecksumCalculatorImpl::hash_file(
    const std::string &algorithm, const std::string &file_path, std::string &hex_digest) const
{
    std::ifstream fs {file_path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << file_path << " for checksum computation";
        return false;
    }
    return hash(algorithm, fs, hex_digest);
}

const EVP_MD *ChecksumCalculatorImpl::digest_by_name(const std::string &algorithm)
{
    std::string name;
    std::transform(algorithm.cbegin(), algorithm.cend(), std::back_inserter(name),
        [](unsigned char c) { return char(std::tolower(c)); });

    if (name.empty() || name == "none")
    {
        return nullptr;
    }
    return EVP_get_digestbyname(name.c_str());
}
}  // namespace ircdcc::crypto
