#include "winusb/image_mount_service.hpp"

#include "winusb/content_inspector.hpp"

namespace winusb {

Result IImageMountService::ListFiles(const std::string& root, std::vector<FileEntry>& out) {
    return ContentInspector::Enumerate(root, out);
}

} // namespace winusb
