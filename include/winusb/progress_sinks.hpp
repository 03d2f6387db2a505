#pragma once

#include "winusb/creation_state.hpp"
#include "winusb/transfer_stats.hpp"

#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace winusb {

class IStateSink {
  public:
    virtual ~IStateSink() = default;
    virtual void OnState(const CreationState& s) = 0;
};

// Single-line stderr renderer: "[copying]  42% | install.wim | 38.2 MB/s | About 3 min".
class ConsoleStateSink final : public IStateSink {
  public:
    using Clock = TransferStats::Clock;

    explicit ConsoleStateSink(std::FILE* out = stderr,
                              std::function<Clock::time_point()> now = nullptr);

    void OnState(const CreationState& s) override;

    // Text of the line without the leading carriage return.
    std::string Render(const CreationState& s) const;

  private:
    std::FILE* out_;
    std::function<Clock::time_point()> now_;
    TransferStats stats_;
};

// Writes the latest state as a JSON object, replacing the file atomically.
class FileStateSink final : public IStateSink {
  public:
    explicit FileStateSink(std::string path);

    void OnState(const CreationState& s) override;

    static std::string ToJson(const CreationState& s);

  private:
    std::string path_;
};

// Fans one state out to several sinks.
class StateSinkList final : public IStateSink {
  public:
    void Add(std::unique_ptr<IStateSink> sink);
    void OnState(const CreationState& s) override;
    bool Empty() const { return sinks_.empty(); }

  private:
    std::vector<std::unique_ptr<IStateSink>> sinks_;
};

// The logger calls these while holding Logger::OutputMutex().
bool IsProgressLineActive();
void ClearProgressLine();

} // namespace winusb
