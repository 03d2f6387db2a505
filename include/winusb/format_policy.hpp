#pragma once

#include "winusb/models.hpp"

#include <vector>

namespace winusb {

enum class TargetFilesystem { Fat32, ExFat };

struct TargetLayout {
    TargetFilesystem filesystem = TargetFilesystem::Fat32;
    bool use_gpt = false;
    // GPT puts the EFI system partition first and data second; MBR has one data partition.
    int data_partition_index = 1;
};

class FormatPolicy {
  public:
    // exFAT on GPT when any file exceeds the FAT32 ceiling, FAT32 on MBR otherwise.
    // Must run before formatting: the filesystem cannot change once copying starts.
    static TargetLayout ChooseLayout(const std::vector<FileEntry>& files);

    static TargetLayout LayoutFor(TargetFilesystem fs);
};

const char* FilesystemName(TargetFilesystem fs);

} // namespace winusb
