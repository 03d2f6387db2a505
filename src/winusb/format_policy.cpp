#include "winusb/format_policy.hpp"

#include "winusb/content_inspector.hpp"

namespace winusb {

TargetLayout FormatPolicy::ChooseLayout(const std::vector<FileEntry>& files) {
    return LayoutFor(ContentInspector::HasOversizedFile(files, kFat32MaxFileSize)
                         ? TargetFilesystem::ExFat
                         : TargetFilesystem::Fat32);
}

TargetLayout FormatPolicy::LayoutFor(TargetFilesystem fs) {
    TargetLayout layout;
    layout.filesystem = fs;
    layout.use_gpt = (fs == TargetFilesystem::ExFat);
    layout.data_partition_index = layout.use_gpt ? 2 : 1;
    return layout;
}

const char* FilesystemName(TargetFilesystem fs) {
    switch (fs) {
        case TargetFilesystem::Fat32: return "FAT32";
        case TargetFilesystem::ExFat: return "exFAT";
    }
    return "unknown";
}

} // namespace winusb
