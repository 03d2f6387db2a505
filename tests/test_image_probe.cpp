#include "testing.hpp"
#include "winusb/image_probe.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace winusb {
namespace {

TEST(ImageProbeTest, ReadsIso9660Directory) {
    testutil::TemporaryDirectory tmp;
    const std::string iso = tmp.Path() + "/win.iso";
    testutil::BuildIso(iso,
                       {
                           {"setup.exe", "MZ"},
                           {"sources", "", AE_IFDIR},
                           {"sources/install.wim", testutil::Pattern(5000)},
                       });

    auto report = ImageProbe::Probe(iso);
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_GE(report->entries_scanned, 2u);
    EXPECT_NE(report->format_name.find("ISO9660"), std::string::npos);
    const auto& top = report->top_level;
    EXPECT_NE(std::find(top.begin(), top.end(), "sources"), top.end());
}

TEST(ImageProbeTest, StopsAtEntryLimit) {
    testutil::TemporaryDirectory tmp;
    const std::string iso = tmp.Path() + "/win.iso";
    testutil::BuildIso(iso, {{"a.txt", "a"}, {"b.txt", "b"}, {"c.txt", "c"}});

    auto report = ImageProbe::Probe(iso, 1);
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_EQ(report->entries_scanned, 1u);
}

TEST(ImageProbeTest, RejectsNonImage) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Path(), "notes.iso", std::string(64 * 1024, 'x'));
    EXPECT_FALSE(ImageProbe::Probe(tmp.Path() + "/notes.iso").has_value());
}

TEST(ImageProbeTest, MissingFileFails) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(ImageProbe::Probe(tmp.Path() + "/absent.iso").has_value());
}

} // namespace
} // namespace winusb
