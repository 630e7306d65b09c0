#ifndef IRCDCC_TEST_TOKENGENERATOR_MOCK_HPP_
#define IRCDCC_TEST_TOKENGENERATOR_MOCK_HPP_

#include <gmock/gmock.h>

#include "tokengenerator.hpp"

using namespace ::ircdcc::crypto;

class TokenGeneratorMock : public TokenGenerator
{
public:
    MOCK_METHOD(std::string, generate, (size_t), (override));
};

#endif  // IRCDCC_TEST_TOKENGENERATOR_MOCK_HPP_
