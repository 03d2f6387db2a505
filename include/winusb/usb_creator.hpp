#pragma once

#include "util/result.hpp"
#include "winusb/cancel_token.hpp"
#include "winusb/creation_state.hpp"
#include "winusb/disk_utility.hpp"
#include "winusb/format_policy.hpp"
#include "winusb/image_mount_service.hpp"
#include "winusb/models.hpp"
#include "winusb/streaming_copier.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace winusb {

// Sequences one bootable-drive creation:
// Mounting -> inspect -> Formatting -> remount -> Copying -> Finalizing -> Completed,
// with Failed or Cancelled as the alternative terminal states.
class UsbCreator {
  public:
    struct Options {
        std::string volume_label = kDefaultVolumeLabel;
        // Formatting invalidates prior mounts; the device needs time to re-appear.
        std::chrono::milliseconds settle_delay{2000};
        // Refuse images without sources/install.wim or sources/install.esd.
        bool require_windows_layout = false;
        // Read the ISO 9660 directory with libarchive before mounting.
        bool probe_image = false;
        // Hex SHA-256 the image must match; empty skips verification.
        std::string expected_sha256;
        std::function<void(std::chrono::milliseconds)> sleep; // defaults to this_thread::sleep_for
    };

    UsbCreator(IDiskUtility& disk, IImageMountService& images);
    UsbCreator(IDiskUtility& disk,
               IImageMountService& images,
               Options opt,
               std::unique_ptr<IFileCopier> copier = nullptr);
    UsbCreator(const UsbCreator&) = delete;
    UsbCreator& operator=(const UsbCreator&) = delete;

    // Runs to a terminal state, publishing each transition through on_state on
    // the calling thread. Rejected without emitting anything while another run
    // is in flight.
    Result Run(const ImageInfo& image, const RemovableDrive& drive, const StateCallback& on_state);

    // Stops the active run at the next step boundary or copy checkpoint. A
    // request made while idle applies to the next run; the token is cleared
    // when a run ends.
    void Cancel() { cancel_.Cancel(); }
    void LinkCancelFlag(const std::atomic_bool* external) { cancel_.Link(external); }

    bool Busy() const { return busy_.load(); }
    const Options& options() const { return opt_; }

  private:
    struct RunContext {
        const ImageInfo& image;
        const RemovableDrive& drive;
        const StateCallback& on_state;
        std::string image_mount;
        std::string usb_mount;
    };

    Result Execute(RunContext& ctx);
    Result VerifyImage(const ImageInfo& image);
    Result CopyAll(RunContext& ctx, const std::vector<FileEntry>& files, std::uint64_t total);
    void ReleaseImage(RunContext& ctx);
    void Emit(const RunContext& ctx, const CreationState& s) const;
    bool Cancelled() const { return cancel_.IsCancelled(); }

    IDiskUtility& disk_;
    IImageMountService& images_;
    Options opt_;
    std::unique_ptr<IFileCopier> copier_;
    CancelToken cancel_;
    std::atomic_bool busy_{false};
};

} // namespace winusb
