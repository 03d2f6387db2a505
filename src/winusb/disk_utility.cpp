#include "winusb/disk_utility.hpp"

namespace winusb {

bool IndicatesFormatFailure(std::string_view output) {
    static constexpr std::string_view kIndicators[] = {"Error", "error", "failed", "Failed"};
    for (const auto indicator : kIndicators) {
        if (output.find(indicator) != std::string_view::npos) return true;
    }
    return false;
}

} // namespace winusb
