#pragma once

#include "util/result.hpp"
#include "winusb/models.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace winusb {

// Drives smaller than this cannot hold Windows setup media.
inline constexpr std::uint64_t kMinDriveBytes = 4'000'000'000ULL;

inline constexpr const char kDefaultVolumeLabel[] = "WINUSB";

struct FormatOutcome {
    bool ok = false;
    // Raw diagnostic text of the underlying tools.
    std::string output;
};

// True when the tool output reports an error even if the tools exited cleanly.
bool IndicatesFormatFailure(std::string_view output);

class IDiskUtility {
  public:
    virtual ~IDiskUtility() = default;

    virtual Result ListRemovableDrives(std::vector<RemovableDrive>& out) = 0;

    // Each unmounts the device's volumes before erasing it.
    virtual FormatOutcome FormatAsExFat(const std::string& device_path,
                                        const std::string& volume_label) = 0;
    virtual FormatOutcome FormatAsFat32(const std::string& device_path,
                                        const std::string& volume_label) = 0;

    virtual Result Mount(const std::string& device_path, std::string& out_mount_point) = 0;
    virtual Result Unmount(const std::string& device_path) = 0;
    virtual Result Eject(const std::string& device_path) = 0;

    // Flushes the filesystem mounted at mount_point to stable storage.
    virtual Result Sync(const std::string& mount_point) = 0;

    virtual std::string PartitionPath(const std::string& device_path, int index) const = 0;
};

} // namespace winusb
