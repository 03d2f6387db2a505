#include "winusb/linux_disk_utility.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace winusb {

namespace {

constexpr const char kMicrosoftBasicDataGuid[] = "EBD0A0A2-B9E5-4433-87C0-68B6B72699C7";
constexpr const char kEfiVolumeLabel[] = "EFI";

std::string Trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string StringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return Trim(it->get<std::string>());
}

// Older lsblk releases print every column as a string.
bool FlagField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number_integer()) return it->get<long long>() != 0;
    if (it->is_string()) {
        const std::string v = it->get<std::string>();
        return v == "1" || v == "true";
    }
    return false;
}

std::uint64_t SizeField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return 0;
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (it->is_number_integer()) {
        const auto v = it->get<long long>();
        return v > 0 ? static_cast<std::uint64_t>(v) : 0;
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

void CollectMountPoints(const nlohmann::json& node, std::vector<std::string>& out) {
    const std::string mp = StringField(node, "mountpoint");
    if (!mp.empty()) out.push_back(mp);

    auto children = node.find("children");
    if (children != node.end() && children->is_array()) {
        for (const auto& child : *children) CollectMountPoints(child, out);
    }
}

} // namespace

std::expected<std::vector<RemovableDrive>, std::string> ParseLsblkDrives(std::string_view json,
                                                                         std::uint64_t min_bytes) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("lsblk output is not JSON: ") + e.what());
    }

    auto devices = j.find("blockdevices");
    if (!j.is_object() || devices == j.end() || !devices->is_array()) {
        return std::unexpected(std::string("lsblk output has no blockdevices array"));
    }

    std::vector<RemovableDrive> drives;
    for (const auto& dev : *devices) {
        if (!dev.is_object()) continue;

        const std::string id = StringField(dev, "name");
        if (id.empty()) continue;

        const std::string type = StringField(dev, "type");
        if (!type.empty() && type != "disk") continue;

        const bool removable = FlagField(dev, "rm") || FlagField(dev, "hotplug");
        const std::uint64_t size = SizeField(dev, "size");
        if (!removable || size < min_bytes) continue;

        RemovableDrive drive;
        drive.id = id;
        drive.device_path = StringField(dev, "path");
        if (drive.device_path.empty()) drive.device_path = "/dev/" + id;
        drive.size = size;
        drive.removable = removable;

        // Prefer the media name, then vendor, then the volume label.
        drive.name = StringField(dev, "model");
        if (drive.name.empty()) drive.name = StringField(dev, "vendor");
        if (drive.name.empty()) drive.name = StringField(dev, "label");
        if (drive.name.empty()) drive.name = id;

        drives.push_back(std::move(drive));
    }

    return drives;
}

std::expected<std::vector<std::string>, std::string> ParseLsblkMountPoints(std::string_view json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("lsblk output is not JSON: ") + e.what());
    }

    auto devices = j.find("blockdevices");
    if (!j.is_object() || devices == j.end() || !devices->is_array()) {
        return std::unexpected(std::string("lsblk output has no blockdevices array"));
    }

    std::vector<std::string> mount_points;
    for (const auto& dev : *devices) CollectMountPoints(dev, mount_points);
    return mount_points;
}

LinuxDiskUtility::LinuxDiskUtility() : LinuxDiskUtility(Options{}) {}

LinuxDiskUtility::LinuxDiskUtility(Options opt,
                                   std::shared_ptr<const ICommandRunner> runner,
                                   std::shared_ptr<const MountSession::ISystemOps> mount_ops)
    : opt_(std::move(opt)),
      runner_(runner ? std::move(runner) : DefaultCommandRunner()),
      mount_ops_(std::move(mount_ops)) {}

LinuxDiskUtility::~LinuxDiskUtility() {
    for (auto& [device, session] : sessions_) {
        const std::string dir = session.Detach();
        if (!dir.empty()) {
            LogInfo("%s stays mounted at %s", device.c_str(), dir.c_str());
        }
    }
}

Result LinuxDiskUtility::ListRemovableDrives(std::vector<RemovableDrive>& out) {
    out.clear();

    CommandOutput lsblk;
    auto r = runner_->Run({"lsblk", "-J", "-b", "-d", "-o",
                           "NAME,PATH,SIZE,RM,HOTPLUG,MODEL,VENDOR,LABEL,TYPE"},
                          {},
                          lsblk);
    if (!r.is_ok()) return r;
    if (lsblk.exit_code != 0) {
        return Result::Fail(-1, "lsblk failed: " + Trim(lsblk.output));
    }

    auto drives = ParseLsblkDrives(lsblk.output, opt_.min_drive_bytes);
    if (!drives) return Result::Fail(-1, drives.error());

    out = std::move(*drives);
    LogDebug("found %zu removable drive(s)", out.size());
    return Result::Ok();
}

std::string LinuxDiskUtility::PartitionScript(const TargetLayout& layout,
                                              const std::string& volume_label) {
    if (layout.use_gpt) {
        return std::string("label: gpt\n") +
               "size=260MiB, type=U, name=\"" + kEfiVolumeLabel + "\"\n" +
               "type=" + kMicrosoftBasicDataGuid + ", name=\"" + volume_label + "\"\n";
    }
    return "label: dos\ntype=c, bootable\n";
}

bool LinuxDiskUtility::RunStep(const std::vector<std::string>& argv,
                               std::string_view stdin_data,
                               FormatOutcome& outcome) const {
    // Only tool output goes into outcome.output; it is scanned for error words.
    LogDebug("$ %s", JoinCommand(argv).c_str());

    CommandOutput out;
    auto r = runner_->Run(argv, stdin_data, out);
    if (!r.is_ok()) {
        outcome.output += r.msg + "\n";
        outcome.ok = false;
        return false;
    }

    outcome.output += out.output;
    if (!out.output.empty() && out.output.back() != '\n') outcome.output.push_back('\n');
    if (out.exit_code != 0) {
        outcome.output += argv[0] + " failed with exit code " + std::to_string(out.exit_code) + "\n";
        outcome.ok = false;
        return false;
    }
    return true;
}

FormatOutcome LinuxDiskUtility::Erase(const std::string& device_path,
                                      const std::string& volume_label,
                                      const TargetLayout& layout) {
    FormatOutcome outcome;
    outcome.ok = true;

    LogInfo("Formatting %s as %s (%s)",
            device_path.c_str(),
            FilesystemName(layout.filesystem),
            layout.use_gpt ? "GPT" : "MBR");

    if (auto r = UnmountVolumes(device_path); !r.is_ok()) {
        outcome.ok = false;
        outcome.output += "Error: cannot unmount " + device_path + ": " + r.msg + "\n";
        return outcome;
    }

    const std::string script = PartitionScript(layout, volume_label);
    if (!RunStep({"wipefs", "--all", device_path}, {}, outcome) ||
        !RunStep({"sfdisk", "--wipe", "always", "--wipe-partitions", "always", device_path},
                 script,
                 outcome) ||
        !RunStep({"partprobe", device_path}, {}, outcome) ||
        !RunStep({"udevadm", "settle"}, {}, outcome)) {
        return outcome;
    }

    const std::string first = PartitionPath(device_path, 1);
    if (layout.filesystem == TargetFilesystem::Fat32) {
        RunStep({"mkfs.vfat", "-F", "32", "-n", volume_label, first}, {}, outcome);
        return outcome;
    }

    const std::string data = PartitionPath(device_path, layout.data_partition_index);
    if (!RunStep({"mkfs.vfat", "-F", "32", "-n", kEfiVolumeLabel, first}, {}, outcome)) {
        return outcome;
    }
    RunStep({"mkfs.exfat", "-L", volume_label, data}, {}, outcome);
    return outcome;
}

FormatOutcome LinuxDiskUtility::FormatAsExFat(const std::string& device_path,
                                              const std::string& volume_label) {
    return Erase(device_path, volume_label, FormatPolicy::LayoutFor(TargetFilesystem::ExFat));
}

FormatOutcome LinuxDiskUtility::FormatAsFat32(const std::string& device_path,
                                              const std::string& volume_label) {
    return Erase(device_path, volume_label, FormatPolicy::LayoutFor(TargetFilesystem::Fat32));
}

Result LinuxDiskUtility::Mount(const std::string& device_path, std::string& out_mount_point) {
    auto it = sessions_.find(device_path);
    if (it != sessions_.end() && it->second.Mounted()) {
        out_mount_point = it->second.Dir();
        return Result::Ok();
    }

    MountSession session(mount_ops_);
    auto r = MountSession::MountDevice(
        device_path, opt_.mount_base_dir, "usb-", {"vfat", "exfat"}, 0UL, session);
    if (!r.is_ok()) return r;

    out_mount_point = session.Dir();
    sessions_.insert_or_assign(device_path, std::move(session));
    LogInfo("%s mounted at %s", device_path.c_str(), out_mount_point.c_str());
    return Result::Ok();
}

bool LinuxDiskUtility::IsSameDevice(const std::string& path, const std::string& device_path) const {
    if (path == device_path) return true;

    // "/dev/sdb1" -> "/dev/sdb", "/dev/nvme0n1p1" -> "/dev/nvme0n1p"
    std::string prefix = PartitionPath(device_path, 1);
    prefix.pop_back();
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) return false;
    return std::all_of(path.begin() + prefix.size(), path.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

Result LinuxDiskUtility::UnmountVolumes(const std::string& device_path) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (!IsSameDevice(it->first, device_path)) {
            ++it;
            continue;
        }
        auto r = it->second.Unmount();
        if (!r.is_ok()) return r;
        it = sessions_.erase(it);
    }

    CommandOutput lsblk;
    auto r = runner_->Run({"lsblk", "-J", "-o", "PATH,MOUNTPOINT", device_path}, {}, lsblk);
    if (!r.is_ok()) return r;
    if (lsblk.exit_code != 0) {
        return Result::Fail(-1, "lsblk failed: " + Trim(lsblk.output));
    }

    auto mount_points = ParseLsblkMountPoints(lsblk.output);
    if (!mount_points) return Result::Fail(-1, mount_points.error());

    for (const auto& mp : *mount_points) {
        LogDebug("unmounting %s", mp.c_str());
        CommandOutput umount;
        auto ur = runner_->Run({"umount", mp}, {}, umount);
        if (!ur.is_ok()) return ur;
        if (umount.exit_code != 0) {
            return Result::Fail(-1, "umount " + mp + ": " + Trim(umount.output));
        }
    }
    return Result::Ok();
}

Result LinuxDiskUtility::Unmount(const std::string& device_path) {
    return UnmountVolumes(device_path);
}

Result LinuxDiskUtility::Eject(const std::string& device_path) {
    if (auto r = UnmountVolumes(device_path); !r.is_ok()) return r;

    CommandOutput out;
    auto r = runner_->Run({"eject", device_path}, {}, out);
    if (r.is_ok() && out.exit_code == 0) return Result::Ok();

    LogDebug("eject %s: %s", device_path.c_str(), Trim(out.output).c_str());
    r = runner_->Run({"udisksctl", "power-off", "-b", device_path}, {}, out);
    if (!r.is_ok()) return r;
    if (out.exit_code != 0) {
        return Result::Fail(-1, "cannot eject " + device_path + ": " + Trim(out.output));
    }
    return Result::Ok();
}

Result LinuxDiskUtility::Sync(const std::string& mount_point) {
    Fd dir(::open(mount_point.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir.Valid()) {
        const int err = errno;
        return Result::Fail(err, "open " + mount_point + ": " + std::strerror(err));
    }
    if (::syncfs(dir.Get()) != 0) {
        const int err = errno;
        return Result::Fail(err, "syncfs " + mount_point + ": " + std::strerror(err));
    }
    ::sync();
    return Result::Ok();
}

std::string LinuxDiskUtility::PartitionPath(const std::string& device_path, int index) const {
    return PartitionDevicePath(device_path, index);
}

} // namespace winusb
