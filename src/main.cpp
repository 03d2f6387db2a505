#define _FILE_OFFSET_BITS 64

#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "winusb/creation_task.hpp"
#include "winusb/errors.hpp"
#include "winusb/linux_disk_utility.hpp"
#include "winusb/loop_image_mount_service.hpp"
#include "winusb/progress_sinks.hpp"
#include "winusb/usb_creator.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s --list-drives\n"
        "   %s -i <iso> -d <drive id|/dev/sdX> [-c <config>] [--progress-file <path>]\n"
        "      [--sha256 <hex>] [--yes] [--eject] [-v]\n"
        "\n"
        "Options:\n"
        "  -l, --list-drives      List removable drives large enough for Windows setup\n"
        "  -i, --image            Windows ISO image\n"
        "  -d, --drive            Target drive id (e.g. sdb) or device path\n"
        "  -c, --config           Config file (default %s)\n"
        "  -p, --progress-file    Write the current state as JSON to this file\n"
        "  -s, --sha256           Expected SHA-256 of the image\n"
        "  -y, --yes              Do not ask before erasing the drive\n"
        "  -e, --eject            Eject the drive when done\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, argv, winusb::config::kDefaultConfigPath);
}

bool IsHexDigest(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int ListDrives(winusb::IDiskUtility& disk) {
    std::vector<winusb::RemovableDrive> drives;
    if (auto r = disk.ListRemovableDrives(drives); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailure;
    }
    if (drives.empty()) {
        std::fprintf(stderr, "No removable drives found\n");
        return kExitOk;
    }
    for (const auto& d : drives) {
        std::printf("%-10s %-14s %s\n", d.id.c_str(), d.device_path.c_str(), d.DisplayName().c_str());
    }
    return kExitOk;
}

const winusb::RemovableDrive* FindDrive(const std::vector<winusb::RemovableDrive>& drives,
                                        const std::string& wanted) {
    for (const auto& d : drives) {
        if (winusb::IsDevPath(wanted) ? d.device_path == wanted : d.id == wanted) {
            return &d;
        }
    }
    return nullptr;
}

bool Confirm(const winusb::RemovableDrive& drive) {
    std::fprintf(stderr,
                 "All data on %s (%s) will be erased. Continue? [y/N] ",
                 drive.device_path.c_str(),
                 drive.DisplayName().c_str());
    std::fflush(stderr);
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

} // namespace

int main(int argc, char **argv) {
    winusb::InstallSignalHandlers();

    bool list_drives = false;
    bool assume_yes = false;
    bool eject = false;
    bool verbose = false;
    std::string image_path;
    std::string drive_arg;
    std::string config_path;
    std::string progress_file;
    std::string sha256;

    static option long_opts[] = {
        {"list-drives", no_argument, nullptr, 'l'},
        {"image", required_argument, nullptr, 'i'},
        {"drive", required_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'c'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"sha256", required_argument, nullptr, 's'},
        {"yes", no_argument, nullptr, 'y'},
        {"eject", no_argument, nullptr, 'e'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hli:d:c:p:s:yev", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'l':
                list_drives = true;
                break;
            case 'i':
                image_path = optarg;
                break;
            case 'd':
                drive_arg = optarg;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'p':
                progress_file = optarg;
                break;
            case 's':
                sha256 = optarg;
                if (!IsHexDigest(sha256)) {
                    std::fprintf(stderr, "Invalid --sha256: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case 'y':
                assume_yes = true;
                break;
            case 'e':
                eject = true;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    // An explicit config must load; the default one is optional.
    winusb::config::CreatorConfigFromFile cfg;
    const bool explicit_config = !config_path.empty();
    if (!explicit_config) config_path = winusb::config::kDefaultConfigPath;
    std::error_code ec;
    if (explicit_config || std::filesystem::exists(config_path, ec)) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            if (explicit_config) {
                std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
                return kExitFailure;
            }
            std::fprintf(stderr, "WARN: %s (using defaults)\n", r.msg.c_str());
            cfg.Reset();
        }
    }

    if (cfg.log_level) winusb::Logger::Instance().SetLevel(*cfg.log_level);
    if (verbose) winusb::Logger::Instance().SetLevel(winusb::LogLevel::Debug);

    winusb::LinuxDiskUtility::Options disk_opt;
    if (cfg.mount_base_dir) disk_opt.mount_base_dir = *cfg.mount_base_dir;
    if (cfg.min_drive_bytes) disk_opt.min_drive_bytes = *cfg.min_drive_bytes;
    winusb::LinuxDiskUtility disk(disk_opt);

    if (list_drives) {
        return ListDrives(disk);
    }

    if (image_path.empty()) {
        std::fprintf(stderr, "ERROR: %s\n", winusb::ErrorMessage(winusb::ErrorKind::NoImageSelected).c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (drive_arg.empty()) {
        std::fprintf(stderr, "ERROR: %s\n", winusb::ErrorMessage(winusb::ErrorKind::NoDriveSelected).c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    auto image = winusb::ImageInfo::FromPath(image_path);
    if (!image) {
        std::fprintf(stderr, "ERROR: %s\n", image.error().c_str());
        return kExitFailure;
    }

    std::vector<winusb::RemovableDrive> drives;
    if (auto r = disk.ListRemovableDrives(drives); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailure;
    }
    const winusb::RemovableDrive* drive = FindDrive(drives, drive_arg);
    if (!drive) {
        std::fprintf(stderr,
                     "ERROR: %s: %s is not a removable drive of at least %llu bytes\n",
                     winusb::ErrorMessage(winusb::ErrorKind::NoDriveSelected).c_str(),
                     drive_arg.c_str(),
                     (unsigned long long)disk_opt.min_drive_bytes);
        return kExitFailure;
    }

    if (!assume_yes) {
        if (!::isatty(STDIN_FILENO)) {
            std::fprintf(stderr, "ERROR: refusing to erase %s without --yes\n", drive->device_path.c_str());
            return kExitUsage;
        }
        if (!Confirm(*drive)) {
            std::fprintf(stderr, "Aborted\n");
            return kExitCancelled;
        }
    }

    winusb::UsbCreator::Options opt;
    if (cfg.volume_label) opt.volume_label = *cfg.volume_label;
    if (cfg.settle_delay_ms) opt.settle_delay = std::chrono::milliseconds(*cfg.settle_delay_ms);
    if (cfg.require_windows_layout) opt.require_windows_layout = *cfg.require_windows_layout;
    if (cfg.probe_image) opt.probe_image = *cfg.probe_image;
    opt.expected_sha256 = sha256;

    winusb::LoopImageMountService images(disk_opt.mount_base_dir);
    winusb::UsbCreator creator(disk, images, opt);
    creator.LinkCancelFlag(&winusb::g_cancel);

    winusb::StateSinkList sinks;
    sinks.Add(std::make_unique<winusb::ConsoleStateSink>());
    if (progress_file.empty() && cfg.progress_file) progress_file = *cfg.progress_file;
    if (!progress_file.empty()) {
        sinks.Add(std::make_unique<winusb::FileStateSink>(progress_file));
    }

    winusb::CreationTask task(creator);
    if (auto r = task.Start(*image, *drive, [&sinks](const winusb::CreationState& s) { sinks.OnState(s); });
        !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailure;
    }

    const winusb::Result res = task.Wait();
    if (res.err == winusb::kCopyCancelled) {
        std::fprintf(stderr, "Cancelled. The drive may be left partially written.\n");
        return kExitCancelled;
    }
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return kExitFailure;
    }

    if (auto r = disk.Unmount(drive->device_path); !r.is_ok()) {
        LogWarn("Unmount %s: %s", drive->device_path.c_str(), r.msg.c_str());
    }
    if (eject) {
        if (auto r = disk.Eject(drive->device_path); !r.is_ok()) {
            LogWarn("Eject %s: %s", drive->device_path.c_str(), r.msg.c_str());
        } else {
            LogInfo("%s can be removed", drive->device_path.c_str());
        }
    }
    return kExitOk;
}
