#include "winusb/creation_state.hpp"

namespace winusb {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

double OverallProgress(const CreationState& s) {
    return std::visit(Overloaded{
                          [](const state::Idle&) { return 0.0; },
                          [](const state::Mounting&) { return 0.10; },
                          [](const state::Formatting&) { return 0.05; },
                          [](const state::Copying& c) { return 0.10 + c.progress * 0.75; },
                          [](const state::Splitting&) { return 0.90; },
                          [](const state::Finalizing&) { return 0.95; },
                          [](const state::Completed&) { return 1.0; },
                          [](const state::Failed&) { return 0.0; },
                          [](const state::Cancelled&) { return 0.0; },
                      },
                      s);
}

std::string Describe(const CreationState& s) {
    return std::visit(Overloaded{
                          [](const state::Idle&) -> std::string { return "Ready to create"; },
                          [](const state::Mounting&) -> std::string { return "Mounting ISO..."; },
                          [](const state::Formatting&) -> std::string {
                              return "Formatting USB drive...";
                          },
                          [](const state::Copying& c) -> std::string { return c.current_file; },
                          [](const state::Splitting&) -> std::string {
                              return "Splitting large files...";
                          },
                          [](const state::Finalizing&) -> std::string { return "Finalizing..."; },
                          [](const state::Completed&) -> std::string {
                              return "Completed successfully!";
                          },
                          [](const state::Failed& f) -> std::string { return "Failed: " + f.message; },
                          [](const state::Cancelled&) -> std::string { return "Cancelled"; },
                      },
                      s);
}

bool IsInProgress(const CreationState& s) {
    return !std::holds_alternative<state::Idle>(s) && !IsTerminal(s);
}

bool IsTerminal(const CreationState& s) {
    return std::holds_alternative<state::Completed>(s) || std::holds_alternative<state::Failed>(s) ||
           std::holds_alternative<state::Cancelled>(s);
}

std::uint64_t BytesCopied(const CreationState& s) {
    if (const auto* c = std::get_if<state::Copying>(&s)) return c->bytes_copied;
    return 0;
}

std::uint64_t TotalBytes(const CreationState& s) {
    if (const auto* c = std::get_if<state::Copying>(&s)) return c->total_bytes;
    return 0;
}

const char* StateName(const CreationState& s) {
    static constexpr const char* kNames[] = {
        "idle", "mounting", "formatting", "copying", "splitting",
        "finalizing", "completed", "failed", "cancelled",
    };
    return kNames[s.index()];
}

} // namespace winusb
