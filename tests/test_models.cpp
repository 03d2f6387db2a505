#include "testing.hpp"
#include "winusb/models.hpp"

#include <gtest/gtest.h>

namespace winusb {
namespace {

TEST(ModelsTest, ImageInfoFromPath) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Path(), "Win11_23H2.iso", std::string(1234, 'i'));

    auto info = ImageInfo::FromPath(tmp.Path() + "/Win11_23H2.iso");
    ASSERT_TRUE(info.has_value()) << info.error();
    EXPECT_EQ(info->name, "Win11_23H2.iso");
    EXPECT_EQ(info->size, 1234u);
}

TEST(ModelsTest, ImageInfoRejectsMissingAndDirectories) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(ImageInfo::FromPath(tmp.Path() + "/absent.iso").has_value());
    EXPECT_FALSE(ImageInfo::FromPath(tmp.Path()).has_value());
}

TEST(ModelsTest, DrivesCompareById) {
    const RemovableDrive a{"sdb", "SanDisk", "/dev/sdb", 32'000'000'000ULL, true};
    const RemovableDrive b{"sdb", "SanDisk Ultra", "/dev/sdb", 31'000'000'000ULL, true};
    const RemovableDrive c{"sdc", "SanDisk", "/dev/sdc", 32'000'000'000ULL, true};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(ModelsTest, DriveDisplayName) {
    const RemovableDrive d{"sdb", "Ultra Fit", "/dev/sdb", 64'000'000'000ULL, true};
    EXPECT_EQ(d.DisplayName(), "Ultra Fit (64 GB)");
}

} // namespace
} // namespace winusb
