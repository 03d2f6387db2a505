#pragma once

#include "winusb/creation_state.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace winusb {

// Rolling window of (bytes copied, time) samples used to derive throughput and
// time remaining for display. Owned by the presentation side, not the creator.
class TransferStats {
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds kWindow{10};
    static constexpr std::chrono::milliseconds kMinElapsed{300};
    static constexpr double kMaxEtaSeconds = 3600.0;

    void Record(std::uint64_t bytes_copied, Clock::time_point at);

    // Bytes per second between the oldest and newest retained samples. Empty
    // until two samples span more than 300 ms with a positive byte delta.
    std::optional<double> Speed() const;

    // Seconds until total_bytes at the current speed. Empty when speed is
    // unknown, nothing remains, or the estimate exceeds one hour.
    std::optional<double> EtaSeconds(std::uint64_t total_bytes) const;

    // Copying states add a sample; anything else clears the history so the
    // displayed speed and ETA disappear.
    void Observe(const CreationState& s, Clock::time_point at);

    void Reset();
    std::size_t SampleCount() const { return samples_.size(); }

  private:
    struct Sample {
        std::uint64_t bytes = 0;
        Clock::time_point at;
    };

    std::deque<Sample> samples_;
};

} // namespace winusb
