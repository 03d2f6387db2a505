#include "util/config_json_utils.hpp"

#include <fstream>

namespace winusb::config::detail {

namespace {

constexpr std::size_t kMaxFatLabelLength = 11;

enum class Lookup { Missing, Found, WrongType };

Lookup GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Lookup::Missing;
    if (!it->is_string())
        return Lookup::WrongType;
    out = it->get<std::string>();
    return Lookup::Found;
}

Lookup GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Lookup::Missing;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return Lookup::Found;
    }
    if (!it->is_number_integer())
        return Lookup::WrongType;
    auto v = it->get<long long>();
    if (v < 0)
        return Lookup::WrongType;
    out = static_cast<std::uint64_t>(v);
    return Lookup::Found;
}

Lookup GetBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Lookup::Missing;
    if (!it->is_boolean())
        return Lookup::WrongType;
    out = it->get<bool>();
    return Lookup::Found;
}

template <typename T, typename Getter>
bool Assign(const nlohmann::json& j,
            const char* key,
            Getter getter,
            std::optional<T>& dst,
            std::string& err) {
    T value{};
    switch (getter(j, key, value)) {
        case Lookup::Missing:
            return true;
        case Lookup::WrongType:
            err = std::string("wrong type for ") + key;
            return false;
        case Lookup::Found:
            dst = std::move(value);
            return true;
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, CreatorConfigFromFile& cfg, std::string& err) {
    if (!Assign(j, "VolumeLabel", GetString, cfg.volume_label, err) ||
        !Assign(j, "SettleDelayMs", GetU64, cfg.settle_delay_ms, err) ||
        !Assign(j, "MountBaseDir", GetString, cfg.mount_base_dir, err) ||
        !Assign(j, "MinDriveBytes", GetU64, cfg.min_drive_bytes, err) ||
        !Assign(j, "RequireWindowsLayout", GetBool, cfg.require_windows_layout, err) ||
        !Assign(j, "VerifyImageProbe", GetBool, cfg.probe_image, err) ||
        !Assign(j, "ProgressFile", GetString, cfg.progress_file, err)) {
        return false;
    }

    if (cfg.volume_label) {
        if (cfg.volume_label->empty() || cfg.volume_label->size() > kMaxFatLabelLength) {
            err = "VolumeLabel must be 1..11 characters";
            return false;
        }
    }

    std::string level_name;
    switch (GetString(j, "LogLevel", level_name)) {
        case Lookup::Missing:
            break;
        case Lookup::WrongType:
            err = "wrong type for LogLevel";
            return false;
        case Lookup::Found:
            cfg.log_level = ParseLogLevel(level_name);
            if (!cfg.log_level) {
                err = "unknown LogLevel '" + level_name + "'";
                return false;
            }
            break;
    }

    return true;
}

} // namespace winusb::config::detail
