#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "checksumcalculatorimpl.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::ircdcc::crypto;

namespace
{
class ChecksumCalculatorTest : public Test
{
protected:
    std::string hash_string(const std::string &algorithm, const std::string &data)
    {
        std::string digest;
        EXPECT_TRUE(calculator_.hash(algorithm,
            reinterpret_cast<const ChecksumCalculator::Byte *>(data.data()), data.size(), digest));
        return digest;
    }

    ChecksumCalculatorImpl calculator_;
};
}  // namespace

TEST_F(ChecksumCalculatorTest, KnownDigests)
{
    EXPECT_EQ(hash_string("md5", "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hash_string("sha1", "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(hash_string("sha256", "abc"),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hash_string("md5", ""), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(ChecksumCalculatorTest, AlgorithmNameIsCaseInsensitive)
{
    EXPECT_EQ(hash_string("MD5", "abc"), hash_string("md5", "abc"));
    EXPECT_TRUE(calculator_.is_supported("SHA256"));
}

TEST_F(ChecksumCalculatorTest, UnsupportedAlgorithm)
{
    EXPECT_FALSE(calculator_.is_supported("crc32x"));
    EXPECT_FALSE(calculator_.is_supported("none"));
    EXPECT_FALSE(calculator_.is_supported(""));

    std::string digest;
    EXPECT_FALSE(calculator_.hash("crc32x", nullptr, 0, digest));
    EXPECT_TRUE(digest.empty());
}

TEST_F(ChecksumCalculatorTest, StreamMatchesBuffer)
{
    // Larger than the internal buffer so the digest is fed in several chunks
    std::string data(100 * 1024 + 7, '\0');
    for (size_t i = 0; i != data.size(); ++i)
    {
        data[i] = char(i % 253);
    }

    std::istringstream is {data};
    std::string        digest;
    EXPECT_TRUE(calculator_.hash("sha1", is, digest));
    EXPECT_EQ(digest, hash_string("sha1", data));
}

TEST_F(ChecksumCalculatorTest, HashFile)
{
    testutils::TempDir temp_dir {"checksumcalculator_test"};
    auto               path = temp_dir.file("abc.txt");
    std::ofstream {path} << "abc";

    std::string digest;
    EXPECT_TRUE(calculator_.hash_file("md5", path, digest));
    EXPECT_EQ(digest, "900150983cd24fb0d6963f7d28e17f72");

    EXPECT_FALSE(calculator_.hash_file("md5", temp_dir.file("missing"), digest));
}
