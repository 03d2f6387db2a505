#include "winusb/mount_session.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/mount.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace winusb {

namespace {

class PosixSystemOps final : public MountSession::ISystemOps {
  public:
    Result CreateMountPoint(std::string_view mount_base_dir,
                            std::string_view mount_prefix,
                            std::string& out_dir) const override {
        const fs::path base = mount_base_dir.empty() ? fs::path("/mnt") : fs::path(mount_base_dir);
        std::error_code ec;
        fs::create_directories(base, ec);

        std::string tmpl = (base / (std::string(mount_prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int err = errno;
            return Result::Fail(err, "mkdtemp failed: " + std::string(std::strerror(err)));
        }

        out_dir = created;
        return Result::Ok();
    }

    Result Mount(std::string_view device,
                 std::string_view target_dir,
                 std::string_view fs_type,
                 unsigned long mount_flags) const override {
        if (::mount(std::string(device).c_str(),
                    std::string(target_dir).c_str(),
                    std::string(fs_type).c_str(),
                    mount_flags,
                    nullptr) != 0) {
            const int err = errno;
            return Result::Fail(err, "mount failed: " + std::string(std::strerror(err)));
        }
        return Result::Ok();
    }

    Result Unmount(std::string_view target_dir) const override {
        if (::umount2(std::string(target_dir).c_str(), 0) != 0) {
            const int err = errno;
            return Result::Fail(err, "umount failed: " + std::string(std::strerror(err)));
        }
        return Result::Ok();
    }

    void RemoveDirectory(std::string_view dir) const override {
        std::error_code ec;
        fs::remove(fs::path(dir), ec);
    }
};

} // namespace

std::shared_ptr<const MountSession::ISystemOps> MountSession::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

MountSession::MountSession() : system_ops_(DefaultSystemOps()) {}

MountSession::MountSession(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

MountSession::MountSession(MountSession&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)),
      device_(std::move(other.device_)), fs_type_(std::move(other.fs_type_)),
      mounted_(other.mounted_) {
    other.mounted_ = false;
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

MountSession& MountSession::operator=(MountSession&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    device_ = std::move(other.device_);
    fs_type_ = std::move(other.fs_type_);
    mounted_ = other.mounted_;
    other.mounted_ = false;
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

MountSession::~MountSession() { Cleanup(); }

Result MountSession::MountDevice(std::string_view device,
                                 std::string_view mount_base_dir,
                                 std::string_view mount_prefix,
                                 std::initializer_list<std::string_view> fs_types,
                                 unsigned long mount_flags,
                                 MountSession& out) {
    out.Cleanup();

    if (fs_types.size() == 0) {
        return Result::Fail(EINVAL, "no filesystem type to mount " + std::string(device));
    }

    auto create_result = out.system_ops_->CreateMountPoint(mount_base_dir, mount_prefix, out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result;
    }

    Result mount_result = Result::Ok();
    for (const auto fs_type : fs_types) {
        mount_result = out.system_ops_->Mount(device, out.dir_, fs_type, mount_flags);
        if (mount_result.is_ok()) {
            out.device_ = std::string(device);
            out.fs_type_ = std::string(fs_type);
            out.mounted_ = true;
            LogDebug("mounted %.*s (%.*s) at %s",
                     (int)device.size(), device.data(),
                     (int)fs_type.size(), fs_type.data(),
                     out.dir_.c_str());
            return Result::Ok();
        }
        LogDebug("mount %.*s as %.*s: %s",
                 (int)device.size(), device.data(),
                 (int)fs_type.size(), fs_type.data(),
                 mount_result.msg.c_str());
    }

    out.Cleanup();
    return mount_result;
}

Result MountSession::Unmount() {
    if (!mounted_ || dir_.empty())
        return Result::Ok();

    auto unmount_result = system_ops_->Unmount(dir_);
    if (!unmount_result.is_ok())
        return unmount_result;

    mounted_ = false;
    system_ops_->RemoveDirectory(dir_);
    dir_.clear();
    device_.clear();
    fs_type_.clear();
    return Result::Ok();
}

std::string MountSession::Detach() {
    std::string dir = std::move(dir_);
    dir_.clear();
    device_.clear();
    fs_type_.clear();
    mounted_ = false;
    return dir;
}

void MountSession::Cleanup() {
    if (mounted_ && !dir_.empty()) {
        auto r = system_ops_->Unmount(dir_);
        if (!r.is_ok()) {
            LogWarn("cleanup of %s: %s", dir_.c_str(), r.msg.c_str());
        }
    }
    mounted_ = false;
    if (!dir_.empty()) {
        system_ops_->RemoveDirectory(dir_);
        dir_.clear();
    }
    device_.clear();
    fs_type_.clear();
}

} // namespace winusb
