#include "util/format.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace winusb {
namespace {

TEST(FormatTest, SpeedBelowOneMegabytePerSecond) {
    EXPECT_EQ(FormatSpeed(512.0 * 1024.0), "512 KB/s");
}

TEST(FormatTest, SpeedInMegabytesPerSecond) {
    EXPECT_EQ(FormatSpeed(12.5 * 1024.0 * 1024.0), "12.5 MB/s");
}

TEST(FormatTest, EtaBuckets) {
    EXPECT_EQ(FormatEta(std::nullopt), "");
    EXPECT_EQ(FormatEta(1.25), "Less than a minute");
    EXPECT_EQ(FormatEta(59.0), "Less than a minute");
    EXPECT_EQ(FormatEta(61.0), "About 2 min");
    EXPECT_EQ(FormatEta(600.0), "About 10 min");
    EXPECT_EQ(FormatEta(3601.0), "");
    EXPECT_EQ(FormatEta(std::numeric_limits<double>::infinity()), "");
    EXPECT_EQ(FormatEta(std::numeric_limits<double>::quiet_NaN()), "");
}

TEST(FormatTest, Sizes) {
    EXPECT_EQ(FormatSize(950), "950 bytes");
    EXPECT_EQ(FormatSize(8'000'000'000ULL), "8 GB");
    EXPECT_EQ(FormatSize(15'500'000'000ULL), "15.5 GB");
    EXPECT_EQ(FormatSize(64'000'000'000ULL), "64 GB");
}

} // namespace
} // namespace winusb
