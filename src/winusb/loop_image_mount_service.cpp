#include "winusb/loop_image_mount_service.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/loop.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <unistd.h>

namespace winusb {

namespace {

Result Errno(const std::string& what) {
    const int err = errno;
    return Result::Fail(err, what + ": " + std::strerror(err));
}

class KernelLoopOps final : public LoopImageMountService::ILoopOps {
  public:
    Result Attach(const std::string& image_path, std::string& out_loop_device) const override {
        Fd image(::open(image_path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!image.Valid()) return Errno("open " + image_path);

        Fd control(::open("/dev/loop-control", O_RDWR | O_CLOEXEC));
        if (!control.Valid()) return Errno("open /dev/loop-control");

        // Another process may claim the free device first; retry a few times.
        for (int attempt = 0; attempt < 8; ++attempt) {
            const int index = ::ioctl(control.Get(), LOOP_CTL_GET_FREE);
            if (index < 0) return Errno("LOOP_CTL_GET_FREE");

            const std::string device = "/dev/loop" + std::to_string(index);
            Fd loop(::open(device.c_str(), O_RDONLY | O_CLOEXEC));
            if (!loop.Valid()) return Errno("open " + device);

            if (::ioctl(loop.Get(), LOOP_SET_FD, image.Get()) != 0) {
                if (errno == EBUSY) continue;
                return Errno("LOOP_SET_FD " + device);
            }

            loop_info64 info{};
            info.lo_flags = LO_FLAGS_READ_ONLY | LO_FLAGS_AUTOCLEAR;
            std::strncpy(reinterpret_cast<char*>(info.lo_file_name),
                         image_path.c_str(),
                         LO_NAME_SIZE - 1);
            if (::ioctl(loop.Get(), LOOP_SET_STATUS64, &info) != 0) {
                Result r = Errno("LOOP_SET_STATUS64 " + device);
                ::ioctl(loop.Get(), LOOP_CLR_FD, 0);
                return r;
            }

            out_loop_device = device;
            return Result::Ok();
        }
        return Result::Fail(EBUSY, "no free loop device for " + image_path);
    }

    void Detach(const std::string& loop_device) const override {
        Fd loop(::open(loop_device.c_str(), O_RDONLY | O_CLOEXEC));
        if (!loop.Valid()) return;
        if (::ioctl(loop.Get(), LOOP_CLR_FD, 0) != 0 && errno != ENXIO) {
            LogDebug("LOOP_CLR_FD %s: %s", loop_device.c_str(), std::strerror(errno));
        }
    }
};

} // namespace

LoopImageMountService::LoopImageMountService(std::string mount_base_dir,
                                             std::shared_ptr<const ILoopOps> loop_ops,
                                             std::shared_ptr<const MountSession::ISystemOps> mount_ops)
    : mount_base_dir_(std::move(mount_base_dir)),
      loop_ops_(loop_ops ? std::move(loop_ops) : std::make_shared<KernelLoopOps>()),
      mount_ops_(std::move(mount_ops)) {}

LoopImageMountService::~LoopImageMountService() {
    for (auto& [mount_point, attached] : mounts_) {
        auto r = attached.session.Unmount();
        if (!r.is_ok()) {
            LogWarn("unmount %s: %s", mount_point.c_str(), r.msg.c_str());
        }
        loop_ops_->Detach(attached.loop_device);
    }
}

Result LoopImageMountService::MountImage(const std::string& image_path,
                                         std::string& out_mount_point) {
    std::string loop_device;
    if (auto r = loop_ops_->Attach(image_path, loop_device); !r.is_ok()) {
        return r;
    }
    LogDebug("%s attached to %s", image_path.c_str(), loop_device.c_str());

    // Windows media is UDF with an ISO 9660 bridge; prefer the UDF view.
    MountSession session(mount_ops_);
    auto r = MountSession::MountDevice(
        loop_device, mount_base_dir_, "iso-", {"udf", "iso9660"}, MS_RDONLY, session);
    if (!r.is_ok()) {
        loop_ops_->Detach(loop_device);
        return r;
    }

    out_mount_point = session.Dir();
    mounts_.insert_or_assign(out_mount_point, Attached{loop_device, std::move(session)});
    LogInfo("ISO mounted at %s (%s)", out_mount_point.c_str(), loop_device.c_str());
    return Result::Ok();
}

Result LoopImageMountService::UnmountImage(const std::string& mount_point) {
    auto it = mounts_.find(mount_point);
    if (it == mounts_.end()) {
        return Result::Fail(ENOENT, "no image mounted at " + mount_point);
    }

    auto r = it->second.session.Unmount();
    if (!r.is_ok()) return r;

    loop_ops_->Detach(it->second.loop_device);
    mounts_.erase(it);
    return Result::Ok();
}

} // namespace winusb
