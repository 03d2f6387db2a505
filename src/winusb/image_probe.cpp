#include "winusb/image_probe.hpp"

#include "io/file_reader.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include <memory>
#include <span>

namespace winusb {

namespace {

struct ReadCtx {
    IReader* r = nullptr;
    std::vector<std::uint8_t> buf;
    explicit ReadCtx(IReader& rr) : r(&rr), buf(64 * 1024) {}
};

la_ssize_t ReadCallback(archive*, void* cd, const void** buff) {
    auto* c = static_cast<ReadCtx*>(cd);
    const ssize_t n = c->r->Read(std::span<std::uint8_t>(c->buf.data(), c->buf.size()));
    if (n < 0) return -1;
    *buff = c->buf.data();
    return static_cast<la_ssize_t>(n);
}

struct ArchiveDeleter {
    void operator()(archive* a) const { archive_read_free(a); }
};

std::string ErrorString(archive* a) {
    const char* em = archive_error_string(a);
    return em ? em : "unknown";
}

} // namespace

std::expected<ImageProbeReport, std::string> ImageProbe::Probe(const std::string& image_path,
                                                               std::size_t max_entries) {
    FileReader input;
    if (auto r = FileReader::Open(image_path, input); !r.is_ok()) {
        return std::unexpected(r.msg);
    }

    ReadCtx ctx(input);
    std::unique_ptr<archive, ArchiveDeleter> ar(archive_read_new());
    if (!ar) return std::unexpected(std::string("archive_read_new failed"));

    archive_read_support_format_iso9660(ar.get());

    if (archive_read_open2(ar.get(), &ctx, nullptr, ReadCallback, nullptr, nullptr) != ARCHIVE_OK) {
        return std::unexpected("not a disc image: " + ErrorString(ar.get()));
    }

    ImageProbeReport report;
    archive_entry* entry = nullptr;
    while (report.entries_scanned < max_entries) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            if (report.entries_scanned == 0) {
                return std::unexpected("not a disc image: " + ErrorString(ar.get()));
            }
            break;
        }

        if (report.format_name.empty()) {
            const char* name = archive_format_name(ar.get());
            report.format_name = name ? name : "";
        }
        ++report.entries_scanned;

        const char* path = archive_entry_pathname(entry);
        if (path) {
            const std::string rel = NormalizeRelativePath(path);
            const std::string head = rel.substr(0, rel.find('/'));
            if (!head.empty() &&
                std::find(report.top_level.begin(), report.top_level.end(), head) ==
                    report.top_level.end()) {
                report.top_level.push_back(head);
            }
        }

        if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) break;
    }

    if (report.entries_scanned == 0) {
        return std::unexpected(std::string("disc image has no readable entries"));
    }
    return report;
}

} // namespace winusb
