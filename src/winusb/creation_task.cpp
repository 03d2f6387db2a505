#include "winusb/creation_task.hpp"

#include "util/logger.hpp"

#include <cerrno>

namespace winusb {

CreationTask::CreationTask(UsbCreator& creator) : creator_(creator) {}

CreationTask::~CreationTask() {
    if (worker_.joinable()) {
        creator_.Cancel();
        worker_.join();
    }
}

Result CreationTask::Start(ImageInfo image, RemovableDrive drive, StateCallback on_state) {
    std::lock_guard<std::mutex> lk(mu_);
    if (worker_.joinable() || creator_.Busy()) {
        return Result::Fail(EBUSY, "A creation run is already in progress");
    }

    result_.reset();
    worker_ = std::thread([this,
                           image = std::move(image),
                           drive = std::move(drive),
                           on_state = std::move(on_state)] {
        Result r = creator_.Run(image, drive, on_state);
        std::lock_guard<std::mutex> guard(mu_);
        result_ = std::move(r);
    });
    return Result::Ok();
}

void CreationTask::Cancel() {
    if (!Running()) return;
    LogInfo("Cancellation requested");
    creator_.Cancel();
}

Result CreationTask::Wait() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(mu_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (!result_) {
        return Result::Fail(EINVAL, "No creation run was started");
    }
    return *result_;
}

bool CreationTask::Running() const {
    std::lock_guard<std::mutex> lk(mu_);
    return worker_.joinable() && !result_.has_value();
}

} // namespace winusb
