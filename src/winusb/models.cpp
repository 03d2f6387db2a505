#include "winusb/models.hpp"

#include "util/format.hpp"

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace winusb {

std::expected<ImageInfo, std::string> ImageInfo::FromPath(const std::string& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec) {
        return std::unexpected("Could not read ISO: " + path + " (" + ec.message() + ")");
    }
    if (!fs::is_regular_file(st)) {
        return std::unexpected("Could not read ISO: " + path + " is not a regular file");
    }
    if (::access(path.c_str(), R_OK) != 0) {
        return std::unexpected("Could not read ISO: " + path + " is not readable");
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected("Could not read ISO: " + path + " (" + ec.message() + ")");
    }

    ImageInfo info;
    info.path = path;
    info.name = fs::path(path).filename().string();
    info.size = static_cast<std::uint64_t>(size);
    return info;
}

std::string RemovableDrive::DisplayName() const {
    return name + " (" + FormatSize(size) + ")";
}

} // namespace winusb
