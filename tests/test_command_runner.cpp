#include "system/command_runner.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace winusb {
namespace {

TEST(CommandRunnerTest, CapturesMergedOutputAndExitCode) {
    CommandOutput out;
    auto r = DefaultCommandRunner()->Run({"sh", "-c", "echo out; echo err >&2; exit 3"}, {}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_NE(out.output.find("out\n"), std::string::npos);
    EXPECT_NE(out.output.find("err\n"), std::string::npos);
}

TEST(CommandRunnerTest, FeedsStdin) {
    CommandOutput out;
    auto r = DefaultCommandRunner()->Run({"cat"}, "label: dos\ntype=c, bootable\n", out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.output, "label: dos\ntype=c, bootable\n");
}

TEST(CommandRunnerTest, MissingProgramExits127) {
    CommandOutput out;
    auto r = DefaultCommandRunner()->Run({"winusb-no-such-program"}, {}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.exit_code, 127);
}

TEST(CommandRunnerTest, EmptyCommandFails) {
    CommandOutput out;
    EXPECT_FALSE(DefaultCommandRunner()->Run({}, {}, out).is_ok());
}

TEST(CommandRunnerTest, JoinCommand) {
    EXPECT_EQ(JoinCommand({"mkfs.vfat", "-F", "32", "/dev/sdb1"}), "mkfs.vfat -F 32 /dev/sdb1");
    EXPECT_EQ(JoinCommand({}), "");
}

} // namespace
} // namespace winusb
