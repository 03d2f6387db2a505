#include "winusb/usb_creator.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "winusb/content_inspector.hpp"
#include "winusb/errors.hpp"
#include "winusb/image_probe.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace winusb {

namespace {

// The copy phase never shows less than 1% once it has started.
constexpr double kMinCopyFraction = 0.01;

class BusyGuard {
  public:
    explicit BusyGuard(std::atomic_bool& busy) : busy_(busy) {}
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;
    ~BusyGuard() { busy_.store(false); }

  private:
    std::atomic_bool& busy_;
};

Result CancelledResult() { return Result::Fail(kCopyCancelled, "Cancelled"); }

Result MountError(const Result& r) {
    return Fail(IsPermissionError(r.err) ? ErrorKind::PermissionDenied : ErrorKind::MountFailed);
}

} // namespace

UsbCreator::UsbCreator(IDiskUtility& disk, IImageMountService& images)
    : UsbCreator(disk, images, Options{}) {}

UsbCreator::UsbCreator(IDiskUtility& disk,
                       IImageMountService& images,
                       Options opt,
                       std::unique_ptr<IFileCopier> copier)
    : disk_(disk), images_(images), opt_(std::move(opt)),
      copier_(copier ? std::move(copier) : std::make_unique<StreamingCopier>()) {}

Result UsbCreator::Run(const ImageInfo& image,
                       const RemovableDrive& drive,
                       const StateCallback& on_state) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        LogWarn("Creation already in progress, ignoring start request");
        return Result::Fail(EBUSY, "A creation run is already in progress");
    }
    BusyGuard guard(busy_);

    LogInfo("Creating bootable USB: image=%s (%llu bytes) drive=%s (%s)",
            image.path.c_str(),
            (unsigned long long)image.size,
            drive.device_path.c_str(),
            drive.name.c_str());

    RunContext ctx{image, drive, on_state, {}, {}};
    Result res = Execute(ctx);

    if (res.is_ok()) {
        LogInfo("Bootable USB created on %s", drive.device_path.c_str());
        Emit(ctx, state::Completed{});
    } else {
        ReleaseImage(ctx);
        if (!ctx.usb_mount.empty()) {
            LogWarn("Destination left mounted at %s", ctx.usb_mount.c_str());
        }
        if (res.err == kCopyCancelled) {
            LogWarn("Creation cancelled");
            Emit(ctx, state::Cancelled{});
        } else {
            LogError("Creation failed: %s", res.msg.c_str());
            Emit(ctx, state::Failed{res.msg});
        }
    }

    cancel_.Reset();
    return res;
}

Result UsbCreator::Execute(RunContext& ctx) {
    // Step 1: mount the image.
    Emit(ctx, state::Mounting{});
    if (auto r = VerifyImage(ctx.image); !r.is_ok()) return r;
    if (Cancelled()) return CancelledResult();

    if (auto r = images_.MountImage(ctx.image.path, ctx.image_mount); !r.is_ok()) {
        LogError("Mount %s: %s", ctx.image.path.c_str(), r.msg.c_str());
        ctx.image_mount.clear();
        return MountError(r);
    }
    LogInfo("ISO mounted at %s", ctx.image_mount.c_str());

    // Step 2: inspect contents; this decides the filesystem before anything is erased.
    std::vector<FileEntry> files;
    if (auto r = images_.ListFiles(ctx.image_mount, files); !r.is_ok()) {
        return Fail(ErrorKind::Unknown, "Cannot read ISO contents: " + r.msg);
    }
    LogInfo("Found %zu files in ISO", files.size());

    if (const FileEntry* install = ContentInspector::FindInstallImage(files)) {
        LogInfo("Install image %s (%llu bytes)",
                install->path.c_str(),
                (unsigned long long)install->size);
    } else if (opt_.require_windows_layout) {
        LogError("No sources/install.wim or sources/install.esd in %s", ctx.image.path.c_str());
        return Fail(ErrorKind::InvalidImage);
    }

    const std::uint64_t total = ContentInspector::TotalBytes(files);
    if (ctx.drive.size > 0 && total > ctx.drive.size) {
        LogError("ISO contents need %llu bytes, drive holds %llu",
                 (unsigned long long)total,
                 (unsigned long long)ctx.drive.size);
        return Fail(ErrorKind::InsufficientSpace);
    }

    const TargetLayout layout = FormatPolicy::ChooseLayout(files);
    if (layout.use_gpt) {
        for (const auto& f : files) {
            if (f.size > kFat32MaxFileSize) {
                LogInfo("Larger than FAT32 allows: %s (%llu bytes)",
                        f.path.c_str(),
                        (unsigned long long)f.size);
            }
        }
    }
    if (Cancelled()) return CancelledResult();

    // Step 3: format.
    Emit(ctx, state::Formatting{});
    LogInfo("Using %s (%s)", FilesystemName(layout.filesystem), layout.use_gpt ? "GPT" : "MBR");
    const FormatOutcome formatted =
        layout.filesystem == TargetFilesystem::ExFat
            ? disk_.FormatAsExFat(ctx.drive.device_path, opt_.volume_label)
            : disk_.FormatAsFat32(ctx.drive.device_path, opt_.volume_label);
    LogDebug("Format result:\n%s", formatted.output.c_str());
    if (!formatted.ok || IndicatesFormatFailure(formatted.output)) {
        LogError("Format of %s failed:\n%s", ctx.drive.device_path.c_str(), formatted.output.c_str());
        return Fail(ErrorKind::FormatFailed);
    }

    // Step 4: let the device re-appear, then mount its data partition.
    if (opt_.settle_delay.count() > 0) {
        LogDebug("Waiting %lld ms for %s", (long long)opt_.settle_delay.count(),
                 ctx.drive.device_path.c_str());
        if (opt_.sleep) {
            opt_.sleep(opt_.settle_delay);
        } else {
            std::this_thread::sleep_for(opt_.settle_delay);
        }
    }
    if (Cancelled()) return CancelledResult();

    const std::string partition =
        disk_.PartitionPath(ctx.drive.device_path, layout.data_partition_index);
    if (auto r = disk_.Mount(partition, ctx.usb_mount); !r.is_ok()) {
        LogError("Mount %s: %s", partition.c_str(), r.msg.c_str());
        ctx.usb_mount.clear();
        return MountError(r);
    }
    LogInfo("USB mounted at %s", ctx.usb_mount.c_str());

    // Step 5: copy.
    if (auto r = CopyAll(ctx, files, total); !r.is_ok()) return r;

    // Step 6: finalize.
    Emit(ctx, state::Finalizing{});
    if (auto r = disk_.Sync(ctx.usb_mount); !r.is_ok()) {
        return Fail(ErrorKind::CopyFailed, "cannot flush " + ctx.usb_mount + ": " + r.msg);
    }
    ReleaseImage(ctx);
    return Result::Ok();
}

Result UsbCreator::VerifyImage(const ImageInfo& image) {
    if (!opt_.expected_sha256.empty()) {
        LogInfo("Verifying SHA-256 of %s", image.path.c_str());
        std::string actual;
        auto r = Sha256HexFile(image.path, actual, [this](std::uint64_t) { return !Cancelled(); });
        if (Cancelled()) return CancelledResult();
        if (!r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return Fail(ErrorKind::InvalidImage);
        }
        if (!DigestEquals(actual, opt_.expected_sha256)) {
            LogError("SHA-256 mismatch: expected %s, got %s",
                     opt_.expected_sha256.c_str(),
                     actual.c_str());
            return Fail(ErrorKind::InvalidImage);
        }
    }

    if (opt_.probe_image) {
        auto report = ImageProbe::Probe(image.path);
        if (!report) {
            LogError("%s: %s", image.path.c_str(), report.error().c_str());
            return Fail(ErrorKind::InvalidImage);
        }
        LogDebug("%s: %s, %zu entries scanned",
                 image.path.c_str(),
                 report->format_name.c_str(),
                 report->entries_scanned);
    }
    return Result::Ok();
}

Result UsbCreator::CopyAll(RunContext& ctx, const std::vector<FileEntry>& files, std::uint64_t total) {
    Emit(ctx, state::Copying{kMinCopyFraction, "Preparing...", 0, total});

    const fs::path source_root(ctx.image_mount);
    const fs::path dest_root(ctx.usb_mount);
    std::uint64_t copied = 0;

    for (const auto& file : files) {
        if (Cancelled()) return CancelledResult();

        const std::string name = LastPathComponent(file.path);
        const double start =
            std::max(kMinCopyFraction, StreamingCopier::CopyFraction(copied, total));
        Emit(ctx, state::Copying{start, name, copied, total});

        CopyRequest req;
        req.source = (source_root / file.path).string();
        req.destination = (dest_root / file.path).string();
        req.file_size = file.size;
        req.already_copied = copied;
        req.total_size = total;
        req.display_name = name;
        req.cancel = &cancel_;

        auto r = copier_->CopyFile(req, [&](const CopyProgress& p) {
            Emit(ctx,
                 state::Copying{std::max(kMinCopyFraction, p.fraction), name, p.bytes_copied, total});
        });
        if (!r.is_ok()) {
            if (r.err == kCopyCancelled) return CancelledResult();
            LogError("Copy %s: %s", file.path.c_str(), r.msg.c_str());
            return Fail(ErrorKind::CopyFailed, r.msg);
        }

        copied += file.size;
    }

    Emit(ctx, state::Copying{StreamingCopier::kMaxCopyFraction, "Finishing...", total, total});
    LogInfo("Copied %zu files (%llu bytes)", files.size(), (unsigned long long)total);
    return Result::Ok();
}

void UsbCreator::ReleaseImage(RunContext& ctx) {
    if (ctx.image_mount.empty()) return;
    if (auto r = images_.UnmountImage(ctx.image_mount); !r.is_ok()) {
        LogWarn("Unmount ISO at %s: %s", ctx.image_mount.c_str(), r.msg.c_str());
    }
    ctx.image_mount.clear();
}

void UsbCreator::Emit(const RunContext& ctx, const CreationState& s) const {
    if (ctx.on_state) ctx.on_state(s);
}

} // namespace winusb
