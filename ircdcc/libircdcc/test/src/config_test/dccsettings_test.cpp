#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "config.hpp"
#include "dccsettings.hpp"
#include "defaultconfigvalues.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::ircdcc::config;
using ::ircdcc::DefaultConfigValues;
using ::ircdcc::dcc::DCCSettings;

namespace
{
class DCCSettingsTest : public Test
{
protected:
    DCCSettings load(std::map<std::string, std::any> values)
    {
        EXPECT_CALL(config_loader_, load()).WillOnce(Return(std::move(values)));
        return DCCSettings::from_config(
            Config {config_loader_, std::make_unique<DefaultConfigValues>()});
    }

    NiceMock<ConfigLoaderMock> config_loader_;
};
}  // namespace

TEST_F(DCCSettingsTest, EmptyConfigurationGivesDefaults)
{
    auto        settings = load({});
    DCCSettings defaults;

    EXPECT_EQ(settings.enabled, defaults.enabled);
    EXPECT_EQ(settings.download_dir, "downloads");
    EXPECT_EQ(settings.max_file_size, 100u * 1024 * 1024);
    EXPECT_EQ(settings.port_range_start, 1024);
    EXPECT_EQ(settings.port_range_end, 65535);
    EXPECT_EQ(settings.transfer_timeout, std::chrono::seconds {300});
    EXPECT_EQ(settings.checksum_algorithm, "md5");
    EXPECT_EQ(settings.blocked_extensions, defaults.blocked_extensions);
    EXPECT_EQ(settings.passive_token_timeout, std::chrono::seconds {120});
    EXPECT_EQ(settings.transfer_max_age, std::chrono::hours {72});
    EXPECT_EQ(settings.buffer_size, 8192u);
}

TEST_F(DCCSettingsTest, ConfiguredValues)
{
    auto settings = load({{"auto_accept", true}, {"port_range_start", 5000LL},
        {"port_range_end", 5010LL}, {"bandwidth_limit_send_kbps", 64LL},
        {"transfer_timeout", 30LL}, {"advertised_ip", std::string {"203.0.113.7"}}});

    EXPECT_TRUE(settings.auto_accept);
    EXPECT_EQ(settings.port_range_start, 5000);
    EXPECT_EQ(settings.port_range_end, 5010);
    EXPECT_EQ(settings.send_limit_bytes_per_second(), 64u * 1024);
    EXPECT_EQ(settings.recv_limit_bytes_per_second(), 0u);
    EXPECT_EQ(settings.transfer_timeout, std::chrono::seconds {30});
    EXPECT_EQ(settings.advertised_ip, "203.0.113.7");
}

TEST_F(DCCSettingsTest, InvalidValuesAreReplaced)
{
    auto settings = load({{"port_range_start", 70000LL}, {"port_range_end", 2000LL},
        {"max_file_size", -5LL}, {"transfer_timeout", 0LL}, {"buffer_size", -1LL}});

    EXPECT_EQ(settings.port_range_start, 1024);
    EXPECT_EQ(settings.port_range_end, 2000);
    EXPECT_EQ(settings.max_file_size, 100u * 1024 * 1024);
    EXPECT_EQ(settings.transfer_timeout, std::chrono::seconds {300});
    EXPECT_EQ(settings.buffer_size, 8192u);
}

TEST_F(DCCSettingsTest, IntegralFloatsAreAccepted)
{
    auto settings = load({{"maintenance_period", 10.0}, {"transfer_max_age", 1.5}});

    EXPECT_EQ(settings.maintenance_period, std::chrono::seconds {10});
    EXPECT_EQ(settings.transfer_max_age, std::chrono::hours {72});
}

TEST_F(DCCSettingsTest, EmptyPortRangeFallsBackToDefaultRange)
{
    auto settings = load({{"port_range_start", 6000LL}, {"port_range_end", 5000LL}});

    EXPECT_EQ(settings.port_range_start, 1024);
    EXPECT_EQ(settings.port_range_end, 65535);
}
