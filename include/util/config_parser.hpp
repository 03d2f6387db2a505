#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace winusb::config {

inline constexpr const char kDefaultConfigPath[] = "/etc/winusb-creator/winusb.conf";

// Values read from the JSON config file. Absent keys stay empty so command line
// flags and built-in defaults can fill them.
struct CreatorConfigFromFile {
    std::optional<std::string> volume_label;
    std::optional<std::uint64_t> settle_delay_ms;
    std::optional<std::string> mount_base_dir;
    std::optional<std::uint64_t> min_drive_bytes;
    std::optional<bool> require_windows_layout;
    std::optional<bool> probe_image;
    std::optional<std::string> progress_file;
    std::optional<LogLevel> log_level;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace winusb::config
