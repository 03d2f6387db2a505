#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace winusb {

namespace state {

struct Idle {};
struct Mounting {};
struct Formatting {};
struct Copying {
    double progress = 0.0; // fraction of the copy phase, never above 0.99
    std::string current_file;
    std::uint64_t bytes_copied = 0;
    std::uint64_t total_bytes = 0;
};
struct Splitting {};
struct Finalizing {};
struct Completed {};
struct Failed {
    std::string message;
};
struct Cancelled {};

} // namespace state

using CreationState = std::variant<state::Idle,
                                   state::Mounting,
                                   state::Formatting,
                                   state::Copying,
                                   state::Splitting,
                                   state::Finalizing,
                                   state::Completed,
                                   state::Failed,
                                   state::Cancelled>;

using StateCallback = std::function<void(const CreationState&)>;

// Maps every state onto a fixed slice of [0, 1]. Mounting is weighted above
// Formatting even though it runs first; existing front ends rely on these values.
double OverallProgress(const CreationState& s);

std::string Describe(const CreationState& s);

bool IsInProgress(const CreationState& s);
bool IsTerminal(const CreationState& s);

std::uint64_t BytesCopied(const CreationState& s);
std::uint64_t TotalBytes(const CreationState& s);

// Short machine name of the active variant ("copying", "failed", ...).
const char* StateName(const CreationState& s);

} // namespace winusb
