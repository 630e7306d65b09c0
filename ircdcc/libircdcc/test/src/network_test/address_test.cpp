#include <gtest/gtest.h>

#include "address.hpp"
#include "addressresolverimpl.hpp"

using namespace ::testing;
using namespace ::ircdcc::network;

namespace
{
class AddressTest : public Test
{
};
}  // namespace

TEST_F(AddressTest, DottedQuad)
{
    IPv4Address address = 0;
    EXPECT_TRUE(conversion::parse_ipv4_address("192.168.1.1", address));
    EXPECT_EQ(address, 3232235777u);
    EXPECT_EQ(conversion::to_string(address), "192.168.1.1");
}

TEST_F(AddressTest, DCCIntegerForm)
{
    IPv4Address address = 0;
    EXPECT_TRUE(conversion::parse_ipv4_address("3232235777", address));
    EXPECT_EQ(conversion::to_string(address), "192.168.1.1");

    EXPECT_TRUE(conversion::parse_ipv4_address("0", address));
    EXPECT_EQ(conversion::to_string(address), "0.0.0.0");

    EXPECT_TRUE(conversion::parse_ipv4_address("4294967295", address));
    EXPECT_EQ(conversion::to_string(address), "255.255.255.255");
}

TEST_F(AddressTest, Invalid)
{
    IPv4Address address = 7;
    EXPECT_FALSE(conversion::parse_ipv4_address("4294967296", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("256.1.1.1", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("1.1.1", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("1.1.1.1.1", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("a.b.c.d", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("", address));
    EXPECT_FALSE(conversion::parse_ipv4_address("-1", address));
    EXPECT_EQ(address, 7u);

    EXPECT_EQ(conversion::to_ipv4_address("bogus"), 0u);
}

TEST(AddressResolverTest, ConfiguredAddressWins)
{
    AddressResolverImpl resolver;
    EXPECT_EQ(resolver.advertised_address("203.0.113.7"), "203.0.113.7");
    EXPECT_EQ(resolver.advertised_address("3405803783"), "203.0.113.7");
}

TEST(AddressResolverTest, AutoDetectionGivesAnIPv4Address)
{
    AddressResolverImpl resolver;
    IPv4Address         address;
    EXPECT_TRUE(conversion::parse_ipv4_address(resolver.advertised_address(""), address));
    EXPECT_TRUE(conversion::parse_ipv4_address(resolver.advertised_address("not-an-ip"), address));
}
