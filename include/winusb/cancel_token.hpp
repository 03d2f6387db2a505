#pragma once

#include <atomic>

namespace winusb {

// Cooperative cancellation flag. An external flag (e.g. the signal handler's)
// can be linked in so either source stops the run.
class CancelToken {
  public:
    CancelToken() = default;
    explicit CancelToken(const std::atomic_bool* external) : external_(external) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel() { flag_.store(true, std::memory_order_relaxed); }
    void Reset() { flag_.store(false, std::memory_order_relaxed); }
    void Link(const std::atomic_bool* external) { external_ = external; }

    bool IsCancelled() const {
        if (flag_.load(std::memory_order_relaxed)) return true;
        return external_ && external_->load(std::memory_order_relaxed);
    }

  private:
    std::atomic_bool flag_{false};
    const std::atomic_bool* external_ = nullptr;
};

} // namespace winusb
