#pragma once

#include "util/result.hpp"
#include "winusb/creation_state.hpp"
#include "winusb/models.hpp"
#include "winusb/usb_creator.hpp"

#include <mutex>
#include <optional>
#include <thread>

namespace winusb {

// Runs one UsbCreator::Run on a worker thread. State callbacks arrive on that
// thread.
class CreationTask {
  public:
    explicit CreationTask(UsbCreator& creator);
    CreationTask(const CreationTask&) = delete;
    CreationTask& operator=(const CreationTask&) = delete;

    // Cancels and joins a run still in flight.
    ~CreationTask();

    // Fails with EBUSY while a previous run has not been waited for.
    Result Start(ImageInfo image, RemovableDrive drive, StateCallback on_state);

    void Cancel();

    // Joins the worker and returns the result of its run.
    Result Wait();

    bool Running() const;

  private:
    UsbCreator& creator_;
    mutable std::mutex mu_;
    std::thread worker_;
    std::optional<Result> result_;
};

} // namespace winusb
