#include "util/format.hpp"

#include <cmath>
#include <cstdio>

namespace winusb {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kMaxEtaSeconds = 3600.0;
} // namespace

std::string FormatSpeed(double bytes_per_second) {
    char buf[64];
    if (bytes_per_second < kMiB) {
        std::snprintf(buf, sizeof(buf), "%.0f KB/s", bytes_per_second / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f MB/s", bytes_per_second / kMiB);
    }
    return buf;
}

std::string FormatEta(std::optional<double> seconds) {
    if (!seconds) return {};
    const double s = *seconds;
    if (std::isnan(s) || std::isinf(s) || s > kMaxEtaSeconds) return {};
    if (s < 60.0) return "Less than a minute";
    return "About " + std::to_string(static_cast<long long>(std::ceil(s / 60.0))) + " min";
}

std::string FormatSize(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"KB", "MB", "GB", "TB", "PB"};
    if (bytes < 1000) {
        return std::to_string(bytes) + (bytes == 1 ? " byte" : " bytes");
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    value /= 1000.0;
    while (value >= 1000.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1000.0;
        ++unit;
    }

    char buf[64];
    const double frac = std::fmod(value, 1.0);
    if (unit < 2 || value >= 100.0 || frac < 0.05 || frac >= 0.95) {
        std::snprintf(buf, sizeof(buf), "%.0f %s", value, kUnits[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
    }
    return buf;
}

} // namespace winusb
