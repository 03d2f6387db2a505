#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace winusb {

struct ImageProbeReport {
    std::string format_name;          // as reported by libarchive, e.g. "ISO9660"
    std::size_t entries_scanned = 0;
    std::vector<std::string> top_level; // first-level names seen while scanning
};

// Reads the image's ISO 9660 directory without mounting it. A file that is not
// a disc image fails here, before any privileged mount is attempted. UDF-only
// media still exposes its ISO 9660 bridge volume.
class ImageProbe {
  public:
    static constexpr std::size_t kMaxEntries = 256;

    static std::expected<ImageProbeReport, std::string> Probe(const std::string& image_path,
                                                              std::size_t max_entries = kMaxEntries);
};

} // namespace winusb
