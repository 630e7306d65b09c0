#ifndef IRCDCC_TEST_CHECKSUMCALCULATOR_MOCK_HPP_
#define IRCDCC_TEST_CHECKSUMCALCULATOR_MOCK_HPP_

#include <gmock/gmock.h>

#include "checksumcalculator.hpp"

using namespace ::ircdcc::crypto;

class ChecksumCalculatorMock : public ChecksumCalculator
{
public:
    MOCK_METHOD(bool, is_supported, (const std::string &), (const, override));
    MOCK_METHOD(bool, hash, (const std::string &, const Byte *, size_t, std::string &),
        (const, override));
    MOCK_METHOD(
        bool, hash, (const std::string &, InputStream &, std::string &), (const, override));
    MOCK_METHOD(bool, hash_file, (const std::string &, const std::string &, std::string &),
        (const, override));
};

#endif  // IRCDCC_TEST_CHECKSUMCALCULATOR_MOCK_HPP_
