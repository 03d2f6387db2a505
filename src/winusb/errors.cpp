#include "winusb/errors.hpp"

#include <cerrno>

namespace winusb {

std::string ErrorMessage(ErrorKind kind, std::string_view detail) {
    switch (kind) {
        case ErrorKind::NoImageSelected:
            return "No Windows ISO file selected";
        case ErrorKind::NoDriveSelected:
            return "No USB drive selected";
        case ErrorKind::MountFailed:
            return "Failed to mount the ISO file";
        case ErrorKind::FormatFailed:
            return "Failed to format the USB drive";
        case ErrorKind::CopyFailed:
            return "Failed to copy files: " + std::string(detail);
        case ErrorKind::InsufficientSpace:
            return "USB drive doesn't have enough space";
        case ErrorKind::InvalidImage:
            return "The selected file is not a valid Windows ISO";
        case ErrorKind::PermissionDenied:
            return "Permission denied. Please run with administrator privileges.";
        case ErrorKind::SplitFailed:
            return "Failed to split install.wim file";
        case ErrorKind::Unknown:
            return std::string(detail);
    }
    return std::string(detail);
}

Result Fail(ErrorKind kind, std::string_view detail) {
    return Result::Fail(-1, ErrorMessage(kind, detail));
}

bool IsPermissionError(int err) { return err == EPERM || err == EACCES; }

} // namespace winusb
