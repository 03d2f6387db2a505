#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace winusb {

// "512 KB/s" below 1 MiB/s, "12.3 MB/s" above.
std::string FormatSpeed(double bytes_per_second);

// Empty when unknown, non-finite or above one hour; otherwise
// "Less than a minute" or "About N min".
std::string FormatEta(std::optional<double> seconds);

// Decimal units the way file managers show sizes: "950 bytes", "8 GB", "15.5 GB".
std::string FormatSize(std::uint64_t bytes);

} // namespace winusb
