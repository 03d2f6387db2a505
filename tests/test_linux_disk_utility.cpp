#include "testing.hpp"
#include "winusb/linux_disk_utility.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace winusb {
namespace {

constexpr const char kLsblkDrives[] = R"({
  "blockdevices": [
    {"name":"sda","path":"/dev/sda","size":512110190592,"rm":false,"hotplug":false,
     "model":"Samsung SSD 860","vendor":"ATA     ","label":null,"type":"disk"},
    {"name":"sdb","path":"/dev/sdb","size":32015679488,"rm":true,"hotplug":true,
     "model":"Ultra Fit       ","vendor":"SanDisk ","label":null,"type":"disk"},
    {"name":"sdc","path":"/dev/sdc","size":2013265920,"rm":true,"hotplug":true,
     "model":"Tiny","vendor":"Generic","label":null,"type":"disk"},
    {"name":"sdd","path":"/dev/sdd","size":64023257088,"rm":false,"hotplug":true,
     "model":null,"vendor":"Kingston","label":null,"type":"disk"},
    {"name":"sr0","path":"/dev/sr0","size":8000000000,"rm":true,"hotplug":true,
     "model":"DVD-RW","vendor":"HL-DT-ST","label":null,"type":"rom"}
  ]
})";

TEST(ParseLsblkDrivesTest, KeepsRemovableDisksLargeEnough) {
    auto drives = ParseLsblkDrives(kLsblkDrives, kMinDriveBytes);
    ASSERT_TRUE(drives.has_value()) << drives.error();
    ASSERT_EQ(drives->size(), 2u);

    EXPECT_EQ((*drives)[0].id, "sdb");
    EXPECT_EQ((*drives)[0].device_path, "/dev/sdb");
    EXPECT_EQ((*drives)[0].name, "Ultra Fit");
    EXPECT_EQ((*drives)[0].size, 32'015'679'488ULL);
    EXPECT_TRUE((*drives)[0].removable);

    EXPECT_EQ((*drives)[1].id, "sdd");
    EXPECT_EQ((*drives)[1].name, "Kingston");
}

TEST(ParseLsblkDrivesTest, AcceptsStringColumnsFromOlderLsblk) {
    const char* json = R"({"blockdevices":[
        {"name":"sdb","size":"16008609792","rm":"1","hotplug":"0","model":"Cruzer","type":"disk"}
    ]})";
    auto drives = ParseLsblkDrives(json, kMinDriveBytes);
    ASSERT_TRUE(drives.has_value()) << drives.error();
    ASSERT_EQ(drives->size(), 1u);
    EXPECT_EQ((*drives)[0].device_path, "/dev/sdb");
    EXPECT_EQ((*drives)[0].size, 16'008'609'792ULL);
}

TEST(ParseLsblkDrivesTest, FallsBackToIdForName) {
    const char* json = R"({"blockdevices":[
        {"name":"sdb","path":"/dev/sdb","size":16008609792,"rm":1,"type":"disk"}
    ]})";
    auto drives = ParseLsblkDrives(json, kMinDriveBytes);
    ASSERT_TRUE(drives.has_value());
    ASSERT_EQ(drives->size(), 1u);
    EXPECT_EQ((*drives)[0].name, "sdb");
}

TEST(ParseLsblkDrivesTest, RejectsMalformedOutput) {
    EXPECT_FALSE(ParseLsblkDrives("not json", kMinDriveBytes).has_value());
    EXPECT_FALSE(ParseLsblkDrives(R"({"devices":[]})", kMinDriveBytes).has_value());
}

TEST(ParseLsblkMountPointsTest, WalksChildren) {
    const char* json = R"({"blockdevices":[
        {"path":"/dev/sdb","mountpoint":null,"children":[
            {"path":"/dev/sdb1","mountpoint":"/media/user/EFI"},
            {"path":"/dev/sdb2","mountpoint":"/media/user/WINUSB"}
        ]}
    ]})";
    auto mps = ParseLsblkMountPoints(json);
    ASSERT_TRUE(mps.has_value()) << mps.error();
    const std::vector<std::string> expected = {"/media/user/EFI", "/media/user/WINUSB"};
    EXPECT_EQ(*mps, expected);
}

class LinuxDiskUtilityTest : public ::testing::Test {
  protected:
    std::shared_ptr<testutil::FakeCommandRunner> runner = std::make_shared<testutil::FakeCommandRunner>();
    std::shared_ptr<testutil::FakeSystemOps> mount_ops = std::make_shared<testutil::FakeSystemOps>();

    void SetUp() override {
        runner->reply = [](const std::vector<std::string>& argv) {
            if (argv[0] == "lsblk" && argv.size() > 3 && argv[3] == "-d") {
                return CommandOutput{0, kLsblkDrives};
            }
            if (argv[0] == "lsblk") {
                return CommandOutput{0, R"({"blockdevices":[{"path":"/dev/sdb","mountpoint":null,
                    "children":[{"path":"/dev/sdb1","mountpoint":"/media/user/OLD"}]}]})"};
            }
            return CommandOutput{0, ""};
        };
    }

    std::unique_ptr<LinuxDiskUtility> Make() {
        LinuxDiskUtility::Options opt;
        opt.mount_base_dir = "/run/winusb-test";
        return std::make_unique<LinuxDiskUtility>(opt, runner, mount_ops);
    }
};

TEST_F(LinuxDiskUtilityTest, ListRemovableDrivesRunsLsblk) {
    auto disk = Make();
    std::vector<RemovableDrive> drives;
    auto r = disk->ListRemovableDrives(drives);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(drives.size(), 2u);
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0].argv.back(), "NAME,PATH,SIZE,RM,HOTPLUG,MODEL,VENDOR,LABEL,TYPE");
}

TEST_F(LinuxDiskUtilityTest, LsblkFailureIsReported) {
    runner->reply = [](const std::vector<std::string>&) { return CommandOutput{1, "lsblk: boom\n"}; };
    auto disk = Make();
    std::vector<RemovableDrive> drives;
    auto r = disk->ListRemovableDrives(drives);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "lsblk failed: lsblk: boom");
}

TEST_F(LinuxDiskUtilityTest, Fat32FormatSequence) {
    auto disk = Make();
    auto outcome = disk->FormatAsFat32("/dev/sdb", "WINUSB");
    ASSERT_TRUE(outcome.ok) << outcome.output;
    EXPECT_FALSE(IndicatesFormatFailure(outcome.output));

    const std::vector<std::string> programs = {
        "lsblk", "umount", "wipefs", "sfdisk", "partprobe", "udevadm", "mkfs.vfat"};
    EXPECT_EQ(runner->Programs(), programs);

    EXPECT_EQ(runner->calls[1].argv.back(), "/media/user/OLD");
    EXPECT_EQ(runner->calls[3].stdin_data, "label: dos\ntype=c, bootable\n");
    const std::vector<std::string> mkfs = {"mkfs.vfat", "-F", "32", "-n", "WINUSB", "/dev/sdb1"};
    EXPECT_EQ(runner->calls[6].argv, mkfs);
}

TEST_F(LinuxDiskUtilityTest, ExFatFormatSequenceUsesGpt) {
    auto disk = Make();
    auto outcome = disk->FormatAsExFat("/dev/nvme0n1", "WINUSB");
    ASSERT_TRUE(outcome.ok) << outcome.output;

    const auto& calls = runner->calls;
    ASSERT_GE(calls.size(), 2u);
    const auto& sfdisk = calls[calls.size() - 5];
    EXPECT_EQ(sfdisk.argv[0], "sfdisk");
    EXPECT_EQ(sfdisk.stdin_data, LinuxDiskUtility::PartitionScript(FormatPolicy::LayoutFor(TargetFilesystem::ExFat), "WINUSB"));
    EXPECT_NE(sfdisk.stdin_data.find("label: gpt"), std::string::npos);

    const std::vector<std::string> esp = {"mkfs.vfat", "-F", "32", "-n", "EFI", "/dev/nvme0n1p1"};
    const std::vector<std::string> data = {"mkfs.exfat", "-L", "WINUSB", "/dev/nvme0n1p2"};
    EXPECT_EQ(calls[calls.size() - 2].argv, esp);
    EXPECT_EQ(calls.back().argv, data);
}

TEST_F(LinuxDiskUtilityTest, FailingStepStopsFormatting) {
    runner->reply = [](const std::vector<std::string>& argv) {
        if (argv[0] == "lsblk") return CommandOutput{0, R"({"blockdevices":[]})"};
        if (argv[0] == "sfdisk") return CommandOutput{1, "sfdisk: cannot open /dev/sdb: Permission denied\n"};
        return CommandOutput{0, ""};
    };
    auto disk = Make();
    auto outcome = disk->FormatAsFat32("/dev/sdb", "WINUSB");
    EXPECT_FALSE(outcome.ok);
    EXPECT_TRUE(IndicatesFormatFailure(outcome.output));
    EXPECT_EQ(runner->Programs().back(), "sfdisk");
}

TEST_F(LinuxDiskUtilityTest, LabelWithErrorWordsFormatsCleanly) {
    auto disk = Make();
    for (const char* label : {"Failed", "ErrorDisk"}) {
        auto outcome = disk->FormatAsExFat("/dev/sdb", label);
        ASSERT_TRUE(outcome.ok) << outcome.output;
        EXPECT_FALSE(IndicatesFormatFailure(outcome.output)) << outcome.output;
        EXPECT_EQ(outcome.output.find(label), std::string::npos);
    }
}

TEST_F(LinuxDiskUtilityTest, PartitionNaming) {
    auto disk = Make();
    EXPECT_EQ(disk->PartitionPath("/dev/sdb", 1), "/dev/sdb1");
    EXPECT_EQ(disk->PartitionPath("/dev/sdb", 2), "/dev/sdb2");
    EXPECT_EQ(disk->PartitionPath("/dev/nvme0n1", 2), "/dev/nvme0n1p2");
    EXPECT_EQ(disk->PartitionPath("/dev/mmcblk0", 1), "/dev/mmcblk0p1");
}

TEST_F(LinuxDiskUtilityTest, MountTriesVfatThenExfat) {
    mount_ops->accepted_types = {"exfat"};
    auto disk = Make();
    std::string mp;
    auto r = disk->Mount("/dev/sdb2", mp);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(mp, "/tmp/fake-mount1");
    const std::vector<std::string> expected = {"/dev/sdb2:vfat", "/dev/sdb2:exfat"};
    EXPECT_EQ(mount_ops->mount_attempts, expected);

    // A second mount of the same partition reuses the session.
    std::string again;
    ASSERT_TRUE(disk->Mount("/dev/sdb2", again).is_ok());
    EXPECT_EQ(again, mp);
    EXPECT_EQ(mount_ops->create_calls, 1);
}

TEST_F(LinuxDiskUtilityTest, UnmountReleasesOwnSessions) {
    auto disk = Make();
    std::string mp;
    ASSERT_TRUE(disk->Mount("/dev/sdb1", mp).is_ok());
    ASSERT_TRUE(disk->Unmount("/dev/sdb").is_ok());
    EXPECT_EQ(mount_ops->unmount_calls, 1);
}

TEST_F(LinuxDiskUtilityTest, UnmountLeavesDeviceWithSharedPrefixAlone) {
    auto disk = Make();
    std::string sdba;
    std::string sdb;
    ASSERT_TRUE(disk->Mount("/dev/sdba1", sdba).is_ok());
    ASSERT_TRUE(disk->Mount("/dev/sdb1", sdb).is_ok());
    ASSERT_EQ(mount_ops->create_calls, 2);

    ASSERT_TRUE(disk->Unmount("/dev/sdb").is_ok());
    EXPECT_EQ(mount_ops->unmount_calls, 1);

    // /dev/sdba1 keeps its session, so mounting it again does not create a new one.
    std::string again;
    ASSERT_TRUE(disk->Mount("/dev/sdba1", again).is_ok());
    EXPECT_EQ(again, sdba);
    EXPECT_EQ(mount_ops->create_calls, 2);
}

TEST_F(LinuxDiskUtilityTest, DestinationStaysMountedWhenUtilityGoesAway) {
    {
        auto disk = Make();
        std::string mp;
        ASSERT_TRUE(disk->Mount("/dev/sdb1", mp).is_ok());
    }
    EXPECT_EQ(mount_ops->unmount_calls, 0);
}

TEST_F(LinuxDiskUtilityTest, EjectFallsBackToUdisks) {
    runner->reply = [](const std::vector<std::string>& argv) {
        if (argv[0] == "lsblk") return CommandOutput{0, R"({"blockdevices":[]})"};
        if (argv[0] == "eject") return CommandOutput{1, "eject: unable to eject"};
        return CommandOutput{0, ""};
    };
    auto disk = Make();
    ASSERT_TRUE(disk->Eject("/dev/sdb").is_ok());
    const std::vector<std::string> programs = {"lsblk", "eject", "udisksctl"};
    EXPECT_EQ(runner->Programs(), programs);
}

TEST(PartitionScriptTest, GptHasEspAndBasicData) {
    const std::string script =
        LinuxDiskUtility::PartitionScript(FormatPolicy::LayoutFor(TargetFilesystem::ExFat), "WINUSB");
    EXPECT_EQ(script,
              "label: gpt\n"
              "size=260MiB, type=U, name=\"EFI\"\n"
              "type=EBD0A0A2-B9E5-4433-87C0-68B6B72699C7, name=\"WINUSB\"\n");
}

TEST(FormatFailureTest, DetectsErrorWords) {
    EXPECT_TRUE(IndicatesFormatFailure("Error: device busy"));
    EXPECT_TRUE(IndicatesFormatFailure("mkfs failed"));
    EXPECT_TRUE(IndicatesFormatFailure("Failed to write"));
    EXPECT_TRUE(IndicatesFormatFailure("an error occurred"));
    EXPECT_FALSE(IndicatesFormatFailure("mkfs.fat 4.2 (2021-01-31)\n"));
    EXPECT_FALSE(IndicatesFormatFailure(""));
}

} // namespace
} // namespace winusb
