#include <gtest/gtest.h>

#include <limits>

#include "datasizeformatter.hpp"

using namespace ::ircdcccli;

TEST(DataSizeFormatterTest, B)
{
    EXPECT_EQ(DataSizeFormatter {}.format(0), "0 B");
    EXPECT_EQ(DataSizeFormatter {}.format(123, 3, 3), "123 B");
}

TEST(DataSizeFormatterTest, KiB)
{
    EXPECT_EQ(DataSizeFormatter {}.format(1234, 3, 3), "1.205 KiB");
}

TEST(DataSizeFormatterTest, KiB_BelowOneUnit)
{
    EXPECT_EQ(DataSizeFormatter {}.format(1023, 3, 3), "0.999 KiB");
}

TEST(DataSizeFormatterTest, MiB)
{
    EXPECT_EQ(DataSizeFormatter {}.format(5000000, 3, 3), "4.768 MiB");
    EXPECT_EQ(DataSizeFormatter {}.format(104857600, 3, 3), "100 MiB");
}

TEST(DataSizeFormatterTest, GiB)
{
    EXPECT_EQ(DataSizeFormatter {}.format(123456789012, 3, 3), "114.978 GiB");
}

TEST(DataSizeFormatterTest, EiB_LargestValue)
{
    EXPECT_EQ(DataSizeFormatter {}.format(std::numeric_limits<uint64_t>::max(), 3, 3), "16 EiB");
}

TEST(DataSizeFormatterTest, KiB_NoFractionalPart)
{
    EXPECT_EQ(DataSizeFormatter {}.format(1234, 3, 0), "1 KiB");
}

TEST(DataSizeFormatterTest, KiB_NoRemDivision)
{
    EXPECT_EQ(DataSizeFormatter {}.format(1024, 3, 3), "1 KiB");
}
