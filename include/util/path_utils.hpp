#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace winusb {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// Block devices whose name ends in a digit (nvme0n1, mmcblk0, loop0) take a "p"
// separator before the partition number.
inline std::string PartitionDevicePath(std::string_view device, int index) {
    std::string out(device);
    if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.back()))) {
        out.push_back('p');
    }
    out += std::to_string(index);
    return out;
}

// Last component of a '/'-separated path.
inline std::string LastPathComponent(std::string_view path) {
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    const auto slash = path.rfind('/');
    if (slash == std::string_view::npos) return std::string(path);
    return std::string(path.substr(slash + 1));
}

// Normalize an enumerated path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeRelativePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

} // namespace winusb
