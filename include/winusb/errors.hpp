#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace winusb {

enum class ErrorKind {
    NoImageSelected,
    NoDriveSelected,
    MountFailed,
    FormatFailed,
    CopyFailed,
    InsufficientSpace,
    InvalidImage,
    PermissionDenied,
    SplitFailed,
    Unknown,
};

// User-facing text. detail is appended for CopyFailed and is the whole message
// for Unknown; other kinds ignore it.
std::string ErrorMessage(ErrorKind kind, std::string_view detail = {});

Result Fail(ErrorKind kind, std::string_view detail = {});

// EPERM/EACCES from a privileged operation.
bool IsPermissionError(int err);

} // namespace winusb
