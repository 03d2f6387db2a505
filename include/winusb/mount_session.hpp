#pragma once

#include "util/result.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace winusb {

// A mount of one block device on a private temporary directory. The mount is
// released on destruction unless Detach() hands it over to the system.
class MountSession {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateMountPoint(std::string_view mount_base_dir,
                                        std::string_view mount_prefix,
                                        std::string& out_dir) const = 0;
        virtual Result Mount(std::string_view device,
                             std::string_view target_dir,
                             std::string_view fs_type,
                             unsigned long mount_flags) const = 0;
        virtual Result Unmount(std::string_view target_dir) const = 0;
        virtual void RemoveDirectory(std::string_view dir) const = 0;
    };

    MountSession();
    explicit MountSession(std::shared_ptr<const ISystemOps> system_ops);
    MountSession(const MountSession&) = delete;
    MountSession& operator=(const MountSession&) = delete;
    MountSession(MountSession&& other) noexcept;
    MountSession& operator=(MountSession&& other) noexcept;
    ~MountSession();

    // Tries each filesystem type in order and keeps the first that mounts.
    static Result MountDevice(std::string_view device,
                              std::string_view mount_base_dir,
                              std::string_view mount_prefix,
                              std::initializer_list<std::string_view> fs_types,
                              unsigned long mount_flags,
                              MountSession& out);

    Result Unmount();

    // Leaves the filesystem mounted and forgets about it; returns the mount point.
    std::string Detach();

    const std::string& Dir() const { return dir_; }
    const std::string& Device() const { return device_; }
    const std::string& FsType() const { return fs_type_; }
    bool Mounted() const { return mounted_; }

  private:
    void Cleanup();

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
    std::string device_;
    std::string fs_type_;
    bool mounted_ = false;
};

} // namespace winusb
