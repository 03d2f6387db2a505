#pragma once

#include "util/result.hpp"
#include "winusb/models.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace winusb {

// FAT32 cannot store a file larger than 4 GiB - 1.
inline constexpr std::uint64_t kFat32MaxFileSize = 4'294'967'295ULL;

class ContentInspector {
  public:
    // Lists regular files under root with their sizes, sorted by path. Hidden
    // entries, directory symlinks and anything that cannot be read are skipped.
    // Fails only if root itself cannot be opened.
    static Result Enumerate(const std::string& root, std::vector<FileEntry>& out);

    static bool HasOversizedFile(const std::vector<FileEntry>& files,
                                 std::uint64_t ceiling = kFat32MaxFileSize);

    static std::uint64_t TotalBytes(const std::vector<FileEntry>& files);

    // Windows setup media carries sources/install.wim or sources/install.esd.
    static const FileEntry* FindInstallImage(const std::vector<FileEntry>& files);
};

} // namespace winusb
