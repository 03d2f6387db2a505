#include <gtest/gtest.h>

#include "testing.hpp"
#include "winusb/mount_session.hpp"

#include <memory>
#include <string>
#include <sys/mount.h>
#include <vector>

namespace winusb {
namespace {

using testutil::FakeSystemOps;

TEST(MountSessionTest, MountAndUnmountSuccess) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, session);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(session.Dir(), "/tmp/fake-mount1");
    EXPECT_EQ(session.Device(), "/dev/sdb1");
    EXPECT_EQ(session.FsType(), "vfat");
    EXPECT_TRUE(session.Mounted());
    EXPECT_EQ(ops->create_calls, 1);

    auto unmount_res = session.Unmount();
    ASSERT_TRUE(unmount_res.is_ok()) << unmount_res.msg;
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_FALSE(session.Mounted());
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, FallsBackToNextFilesystemType) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->accepted_types = {"iso9660"};
    MountSession session(ops);

    auto res = MountSession::MountDevice(
        "/dev/loop3", "/run/winusb", "iso-", {"udf", "iso9660"}, MS_RDONLY, session);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(session.FsType(), "iso9660");
    const std::vector<std::string> expected = {"/dev/loop3:udf", "/dev/loop3:iso9660"};
    EXPECT_EQ(ops->mount_attempts, expected);
    EXPECT_EQ(ops->last_flags, static_cast<unsigned long>(MS_RDONLY));
}

TEST(MountSessionTest, MountFailureCleansMountPoint) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->accepted_types = {};
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat", "exfat"}, 0UL, session);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.msg, "mount failed: wrong fs type");
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_EQ(ops->mount_attempts.size(), 2u);
    EXPECT_EQ(ops->unmount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, EmptyTypeListIsRejected) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {}, 0UL, session);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(ops->create_calls, 0);
}

TEST(MountSessionTest, UnmountFailureKeepsState) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession session(ops);
    ASSERT_TRUE(MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, session).is_ok());

    ops->unmount_result = Result::Fail(16, "busy");
    auto unmount_res = session.Unmount();
    ASSERT_FALSE(unmount_res.is_ok());
    EXPECT_EQ(unmount_res.msg, "busy");
    EXPECT_EQ(session.Dir(), "/tmp/fake-mount1");
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, CreateMountPointFailureIsPropagated) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->create_result = Result::Fail(2, "mkdtemp failed");
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, session);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.msg, "mkdtemp failed");
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_TRUE(ops->mount_attempts.empty());
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, MoveTransfersActiveSession) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession original(ops);
    ASSERT_TRUE(MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, original).is_ok());

    MountSession moved(std::move(original));
    EXPECT_EQ(moved.Dir(), "/tmp/fake-mount1");

    auto unmount_res = moved.Unmount();
    ASSERT_TRUE(unmount_res.is_ok()) << unmount_res.msg;
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, DetachLeavesFilesystemMounted) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, session).is_ok());
        EXPECT_EQ(session.Detach(), "/tmp/fake-mount1");
        EXPECT_FALSE(session.Mounted());
    }
    EXPECT_EQ(ops->unmount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, DestructorUnmounts) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/sdb1", "/run/winusb", "usb-", {"vfat"}, 0UL, session).is_ok());
    }
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

} // namespace
} // namespace winusb
