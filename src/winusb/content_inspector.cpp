#include "winusb/content_inspector.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace winusb {

namespace {

bool IsHidden(const fs::path& p) {
    const std::string name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// Lists the directory behind it into out. A subdirectory that cannot be opened
// or read to the end is logged and skipped; the walk continues with its siblings.
void Walk(const fs::path& base, const fs::path& dir, fs::directory_iterator it, std::vector<FileEntry>& out) {
    std::error_code ec;
    const fs::directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        if (!IsHidden(entry.path())) {
            std::error_code st_ec;
            const auto link_status = entry.symlink_status(st_ec);
            if (st_ec) {
                LogDebug("skipping %s: %s", entry.path().c_str(), st_ec.message().c_str());
            } else if (fs::is_directory(link_status)) {
                fs::directory_iterator sub(entry.path(), ec);
                if (ec) {
                    LogWarn("skipping %s: %s", entry.path().c_str(), ec.message().c_str());
                    ec.clear();
                } else {
                    Walk(base, entry.path(), std::move(sub), out);
                }
            } else if (entry.is_regular_file(st_ec) && !st_ec) {
                const auto size = entry.file_size(st_ec);
                if (!st_ec) {
                    const std::string rel = NormalizeRelativePath(
                        entry.path().lexically_relative(base).generic_string());
                    out.push_back(FileEntry{rel, static_cast<std::uint64_t>(size)});
                }
            }
        }

        it.increment(ec);
        if (ec) {
            // The stream of this directory is gone; siblings of dir are still walked.
            LogWarn("reading %s: %s", dir.c_str(), ec.message().c_str());
            return;
        }
    }
}

} // namespace

Result ContentInspector::Enumerate(const std::string& root, std::vector<FileEntry>& out) {
    out.clear();

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return Result::Fail(ec.value(), "Cannot open " + root + ": " + ec.message());
    }

    Walk(fs::path(root), fs::path(root), std::move(it), out);
    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path < b.path;
    });
    return Result::Ok();
}

bool ContentInspector::HasOversizedFile(const std::vector<FileEntry>& files,
                                        std::uint64_t ceiling) {
    return std::any_of(files.begin(), files.end(), [ceiling](const FileEntry& f) {
        return f.size > ceiling;
    });
}

std::uint64_t ContentInspector::TotalBytes(const std::vector<FileEntry>& files) {
    std::uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

const FileEntry* ContentInspector::FindInstallImage(const std::vector<FileEntry>& files) {
    for (const auto& f : files) {
        const std::string p = Lower(f.path);
        if (p == "sources/install.wim" || p == "sources/install.esd") return &f;
    }
    return nullptr;
}

} // namespace winusb
