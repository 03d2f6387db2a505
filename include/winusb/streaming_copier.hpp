#pragma once

#include "util/result.hpp"
#include "winusb/cancel_token.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace winusb {

struct CopyRequest {
    std::string source;
    std::string destination;
    std::uint64_t file_size = 0;
    std::uint64_t already_copied = 0; // bytes of earlier files in this run
    std::uint64_t total_size = 0;     // bytes of all files in this run
    std::string display_name;
    const CancelToken* cancel = nullptr;
};

struct CopyProgress {
    double fraction = 0.0;         // min(0.99, overall copied / total)
    std::uint64_t bytes_copied = 0; // overall, including earlier files
};

using CopyProgressFn = std::function<void(const CopyProgress&)>;

// Result::err carries this value when a copy stopped at a cancellation checkpoint.
inline constexpr int kCopyCancelled = -125;

class IFileCopier {
  public:
    virtual ~IFileCopier() = default;
    virtual Result CopyFile(const CopyRequest& req, const CopyProgressFn& on_progress) = 0;
};

class StreamingCopier final : public IFileCopier {
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::uint64_t kStreamingThresholdBytes = 50'000'000;
    static constexpr std::size_t kChunkBytes = 1024 * 1024;
    static constexpr std::chrono::milliseconds kProgressInterval{100};
    static constexpr double kMaxCopyFraction = 0.99;

    struct Options {
        std::uint64_t streaming_threshold_bytes = kStreamingThresholdBytes;
        std::size_t chunk_bytes = kChunkBytes;
        std::chrono::milliseconds progress_interval = kProgressInterval;
        std::function<Clock::time_point()> now; // defaults to Clock::now
    };

    StreamingCopier();
    explicit StreamingCopier(Options opt);

    // Creates destination parents, removes an existing destination file, then
    // copies whole (at or below the threshold) or in chunks with progress.
    Result CopyFile(const CopyRequest& req, const CopyProgressFn& on_progress) override;

    bool UsesStreaming(std::uint64_t file_size) const {
        return file_size > opt_.streaming_threshold_bytes;
    }

    static double CopyFraction(std::uint64_t done, std::uint64_t total);

  private:
    Result CopyWhole(const CopyRequest& req) const;
    Result CopyStreaming(const CopyRequest& req, const CopyProgressFn& on_progress) const;
    Clock::time_point Now() const;

    Options opt_;
};

} // namespace winusb
