#include "winusb/transfer_stats.hpp"

#include <cmath>

namespace winusb {

void TransferStats::Record(std::uint64_t bytes_copied, Clock::time_point at) {
    samples_.push_back(Sample{bytes_copied, at});

    const Clock::time_point newest = samples_.back().at;
    while (!samples_.empty() && newest - samples_.front().at >= kWindow) {
        samples_.pop_front();
    }
}

std::optional<double> TransferStats::Speed() const {
    if (samples_.size() < 2) return std::nullopt;

    const Sample& first = samples_.front();
    const Sample& last = samples_.back();
    const auto elapsed = last.at - first.at;
    if (elapsed <= kMinElapsed) return std::nullopt;
    if (last.bytes <= first.bytes) return std::nullopt;

    const double seconds = std::chrono::duration<double>(elapsed).count();
    return static_cast<double>(last.bytes - first.bytes) / seconds;
}

std::optional<double> TransferStats::EtaSeconds(std::uint64_t total_bytes) const {
    const auto speed = Speed();
    if (!speed || *speed <= 0.0) return std::nullopt;

    const std::uint64_t copied = samples_.back().bytes;
    if (total_bytes <= copied) return std::nullopt;

    const double eta = static_cast<double>(total_bytes - copied) / *speed;
    if (!std::isfinite(eta) || eta <= 0.0 || eta > kMaxEtaSeconds) return std::nullopt;
    return eta;
}

void TransferStats::Observe(const CreationState& s, Clock::time_point at) {
    if (const auto* copying = std::get_if<state::Copying>(&s)) {
        Record(copying->bytes_copied, at);
        return;
    }
    Reset();
}

void TransferStats::Reset() { samples_.clear(); }

} // namespace winusb
