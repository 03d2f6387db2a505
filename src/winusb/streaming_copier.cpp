#include "winusb/streaming_copier.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <span>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace winusb {

StreamingCopier::StreamingCopier() = default;

StreamingCopier::StreamingCopier(Options opt) : opt_(std::move(opt)) {
    if (opt_.chunk_bytes == 0) opt_.chunk_bytes = kChunkBytes;
}

double StreamingCopier::CopyFraction(std::uint64_t done, std::uint64_t total) {
    const double denom = static_cast<double>(std::max<std::uint64_t>(total, 1));
    return std::min(kMaxCopyFraction, static_cast<double>(done) / denom);
}

StreamingCopier::Clock::time_point StreamingCopier::Now() const {
    return opt_.now ? opt_.now() : Clock::now();
}

Result StreamingCopier::CopyFile(const CopyRequest& req, const CopyProgressFn& on_progress) {
    const fs::path dest(req.destination);

    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Result::Fail(ec.value(),
                                "Cannot create directory " + dest.parent_path().string() + ": " +
                                    ec.message());
        }
    }

    fs::remove(dest, ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "Cannot replace " + req.destination + ": " + ec.message());
    }

    if (!UsesStreaming(req.file_size)) {
        return CopyWhole(req);
    }
    return CopyStreaming(req, on_progress);
}

Result StreamingCopier::CopyWhole(const CopyRequest& req) const {
    std::error_code ec;
    if (!fs::copy_file(req.source, req.destination, fs::copy_options::none, ec) || ec) {
        const int err = ec ? ec.value() : -1;
        const std::string why = ec ? ec.message() : "copy_file returned false";
        return Result::Fail(err, "Cannot copy " + req.display_name + ": " + why);
    }
    return Result::Ok();
}

Result StreamingCopier::CopyStreaming(const CopyRequest& req,
                                      const CopyProgressFn& on_progress) const {
    FileReader in;
    if (auto r = FileReader::Open(req.source, in); !r.is_ok()) {
        return Result::Fail(r.err, "Cannot read " + req.display_name + ": " + r.msg);
    }

    FileWriter out;
    if (auto r = FileWriter::Open(req.destination, out); !r.is_ok()) {
        return Result::Fail(r.err, "Cannot write " + req.display_name + ": " + r.msg);
    }

    LogDebug("stream copy %s (%llu bytes)",
             req.display_name.c_str(),
             (unsigned long long)req.file_size);

    std::vector<std::uint8_t> buffer(opt_.chunk_bytes);
    std::uint64_t written = 0;
    auto last_update = Now();

    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "Read error: " + req.display_name);

        auto wr = out.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!wr.is_ok()) {
            return Result::Fail(wr.err, "Write error: " + req.display_name + " (" + wr.msg + ")");
        }
        written += static_cast<std::uint64_t>(n);

        const auto now = Now();
        if (now - last_update < opt_.progress_interval) continue;
        last_update = now;

        const std::uint64_t overall = req.already_copied + written;
        if (on_progress) {
            on_progress(CopyProgress{CopyFraction(overall, req.total_size), overall});
        }

        // Checkpoint: let observers run and honour cancellation.
        if (req.cancel && req.cancel->IsCancelled()) {
            return Result::Fail(kCopyCancelled, "Cancelled while copying " + req.display_name);
        }
        std::this_thread::yield();
    }

    auto fr = out.FsyncNow();
    if (!fr.is_ok()) {
        return Result::Fail(fr.err, "Write error: " + req.display_name + " (" + fr.msg + ")");
    }
    return Result::Ok();
}

} // namespace winusb
