#pragma once

#include "system/command_runner.hpp"
#include "winusb/disk_utility.hpp"
#include "winusb/format_policy.hpp"
#include "winusb/mount_session.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace winusb {

// Disk operations through util-linux, dosfstools and exfatprogs.
class LinuxDiskUtility final : public IDiskUtility {
  public:
    struct Options {
        std::string mount_base_dir = "/run/winusb-creator";
        std::uint64_t min_drive_bytes = kMinDriveBytes;
    };

    LinuxDiskUtility();
    explicit LinuxDiskUtility(Options opt,
                              std::shared_ptr<const ICommandRunner> runner = nullptr,
                              std::shared_ptr<const MountSession::ISystemOps> mount_ops = nullptr);
    LinuxDiskUtility(const LinuxDiskUtility&) = delete;
    LinuxDiskUtility& operator=(const LinuxDiskUtility&) = delete;

    // Destination mounts outlive this object; they are left for the user.
    ~LinuxDiskUtility() override;

    Result ListRemovableDrives(std::vector<RemovableDrive>& out) override;

    FormatOutcome FormatAsExFat(const std::string& device_path,
                                const std::string& volume_label) override;
    FormatOutcome FormatAsFat32(const std::string& device_path,
                                const std::string& volume_label) override;

    Result Mount(const std::string& device_path, std::string& out_mount_point) override;
    Result Unmount(const std::string& device_path) override;
    Result Eject(const std::string& device_path) override;
    Result Sync(const std::string& mount_point) override;

    std::string PartitionPath(const std::string& device_path, int index) const override;

    // sfdisk input describing the partition table for a layout.
    static std::string PartitionScript(const TargetLayout& layout, const std::string& volume_label);

  private:
    FormatOutcome Erase(const std::string& device_path,
                        const std::string& volume_label,
                        const TargetLayout& layout);
    bool RunStep(const std::vector<std::string>& argv,
                 std::string_view stdin_data,
                 FormatOutcome& outcome) const;
    // path is device_path itself or one of its partitions.
    bool IsSameDevice(const std::string& path, const std::string& device_path) const;
    Result UnmountVolumes(const std::string& device_path);

    Options opt_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::shared_ptr<const MountSession::ISystemOps> mount_ops_;
    std::map<std::string, MountSession> sessions_; // keyed by partition path
};

// Parses `lsblk -J -b -d -o NAME,PATH,SIZE,RM,HOTPLUG,MODEL,VENDOR,LABEL,TYPE`
// and keeps whole disks that are removable or hot-pluggable and at least
// min_bytes large.
std::expected<std::vector<RemovableDrive>, std::string> ParseLsblkDrives(std::string_view json,
                                                                         std::uint64_t min_bytes);

// Parses `lsblk -J -o PATH,MOUNTPOINT <device>` into the mount points in use
// anywhere in the device tree.
std::expected<std::vector<std::string>, std::string> ParseLsblkMountPoints(std::string_view json);

} // namespace winusb
