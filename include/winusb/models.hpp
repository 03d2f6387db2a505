#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace winusb {

// Source image chosen by the user. Read-only for the rest of the pipeline.
struct ImageInfo {
    std::string path;
    std::string name;
    std::uint64_t size = 0;

    // Stats path; fails when it is not a readable regular file.
    static std::expected<ImageInfo, std::string> FromPath(const std::string& path);
};

// Snapshot produced by drive enumeration. A rescan yields new instances, so
// selection compares identifiers only.
struct RemovableDrive {
    std::string id;
    std::string name;
    std::string device_path;
    std::uint64_t size = 0;
    bool removable = false;

    std::string DisplayName() const;

    friend bool operator==(const RemovableDrive& a, const RemovableDrive& b) { return a.id == b.id; }
};

struct FileEntry {
    std::string path; // relative to the image root, '/' separated
    std::uint64_t size = 0;

    friend bool operator==(const FileEntry&, const FileEntry&) = default;
};

} // namespace winusb
