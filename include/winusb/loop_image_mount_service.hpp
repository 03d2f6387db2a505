#pragma once

#include "winusb/image_mount_service.hpp"
#include "winusb/mount_session.hpp"

#include <map>
#include <memory>
#include <string>

namespace winusb {

// Attaches an image file to a free loop device and mounts it read-only.
class LoopImageMountService final : public IImageMountService {
  public:
    // Binds an image file to a loop device; the system frees the device once the
    // last mount of it goes away.
    class ILoopOps {
      public:
        virtual ~ILoopOps() = default;
        virtual Result Attach(const std::string& image_path, std::string& out_loop_device) const = 0;
        virtual void Detach(const std::string& loop_device) const = 0;
    };

    explicit LoopImageMountService(std::string mount_base_dir = "/run/winusb-creator",
                                   std::shared_ptr<const ILoopOps> loop_ops = nullptr,
                                   std::shared_ptr<const MountSession::ISystemOps> mount_ops = nullptr);
    LoopImageMountService(const LoopImageMountService&) = delete;
    LoopImageMountService& operator=(const LoopImageMountService&) = delete;
    ~LoopImageMountService() override;

    Result MountImage(const std::string& image_path, std::string& out_mount_point) override;
    Result UnmountImage(const std::string& mount_point) override;

  private:
    struct Attached {
        std::string loop_device;
        MountSession session;
    };

    std::string mount_base_dir_;
    std::shared_ptr<const ILoopOps> loop_ops_;
    std::shared_ptr<const MountSession::ISystemOps> mount_ops_;
    std::map<std::string, Attached> mounts_; // keyed by mount point
};

} // namespace winusb
