#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace winusb::config {

void CreatorConfigFromFile::Reset() {
    volume_label.reset();
    settle_delay_ms.reset();
    mount_base_dir.reset();
    min_drive_bytes.reset();
    require_windows_layout.reset();
    probe_image.reset();
    progress_file.reset();
    log_level.reset();
}

Result CreatorConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace winusb::config
