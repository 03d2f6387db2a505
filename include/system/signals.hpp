#pragma once

#include <atomic>

namespace winusb {

// Set by SIGINT/SIGTERM; polled by the command line front end.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace winusb
