#include "winusb/progress_sinks.hpp"

#include "util/format.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace winusb {

namespace {
std::atomic_bool g_progress_line_active{false};
std::FILE* g_progress_stream = stderr;

int Percent(double fraction) {
    int pct = static_cast<int>(std::lround(fraction * 100.0));
    if (pct < 0) pct = 0;
    if (pct > 100) pct = 100;
    return pct;
}
} // namespace

ConsoleStateSink::ConsoleStateSink(std::FILE* out, std::function<Clock::time_point()> now)
    : out_(out ? out : stderr), now_(std::move(now)) {}

std::string ConsoleStateSink::Render(const CreationState& s) const {
    char head[64];
    std::snprintf(head, sizeof(head), "[%s] %3d%%", StateName(s), Percent(OverallProgress(s)));

    std::string line = head;
    if (const auto* copying = std::get_if<state::Copying>(&s)) {
        if (!copying->current_file.empty()) {
            line += " | " + copying->current_file;
        }
        if (const auto speed = stats_.Speed()) {
            line += " | " + FormatSpeed(*speed);
        }
        const std::string eta = FormatEta(stats_.EtaSeconds(copying->total_bytes));
        if (!eta.empty()) {
            line += " | " + eta;
        }
    } else {
        line += " | " + Describe(s);
    }
    return line;
}

void ConsoleStateSink::OnState(const CreationState& s) {
    stats_.Observe(s, now_ ? now_() : Clock::now());
    const std::string line = Render(s);

    std::lock_guard<std::mutex> lk(Logger::Instance().OutputMutex());
    g_progress_stream = out_;
    // \033[K erases what a longer previous line left behind.
    std::fprintf(out_, "\r%s\033[K", line.c_str());
    if (IsTerminal(s)) {
        std::fprintf(out_, "\n");
        g_progress_line_active = false;
    } else {
        g_progress_line_active = true;
    }
    std::fflush(out_);
}

FileStateSink::FileStateSink(std::string path) : path_(std::move(path)) {}

std::string FileStateSink::ToJson(const CreationState& s) {
    nlohmann::json j;
    j["state"] = StateName(s);
    j["overall_percent"] = Percent(OverallProgress(s));
    j["description"] = Describe(s);
    if (const auto* copying = std::get_if<state::Copying>(&s)) {
        j["current_file"] = copying->current_file;
        j["bytes_copied"] = copying->bytes_copied;
        j["total_bytes"] = copying->total_bytes;
    }
    if (const auto* failed = std::get_if<state::Failed>(&s)) {
        j["error"] = failed->message;
    }
    return j.dump();
}

void FileStateSink::OnState(const CreationState& s) {
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogDebug("cannot write %s", tmp_path.c_str());
        return;
    }
    os << ToJson(s);
    os.close();
    if (!os) {
        LogDebug("short write to %s", tmp_path.c_str());
        return;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogDebug("cannot rename %s to %s", tmp_path.c_str(), path_.c_str());
    }
}

void StateSinkList::Add(std::unique_ptr<IStateSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void StateSinkList::OnState(const CreationState& s) {
    for (auto& sink : sinks_) {
        sink->OnState(s);
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(g_progress_stream, "\n");
        g_progress_line_active = false;
    }
}

} // namespace winusb
