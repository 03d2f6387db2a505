#pragma once

#include "util/result.hpp"
#include "winusb/models.hpp"

#include <string>
#include <vector>

namespace winusb {

class IImageMountService {
  public:
    virtual ~IImageMountService() = default;

    virtual Result MountImage(const std::string& image_path, std::string& out_mount_point) = 0;
    virtual Result UnmountImage(const std::string& mount_point) = 0;

    // Defaults to ContentInspector::Enumerate.
    virtual Result ListFiles(const std::string& root, std::vector<FileEntry>& out);
};

} // namespace winusb
