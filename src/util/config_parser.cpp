#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace treecopy::config {

void TreecopyConfigFromFile::Reset() {
    chunk_size_bytes.reset();
    channel_capacity.reset();
    progress.reset();
    progress_file.reset();
    verify.reset();
    preserve_mode.reset();
    fsync.reset();
    log_level.reset();
}

Result TreecopyConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::ConfigError(path, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::ConfigError(path, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result TreecopyConfigFromFile::LoadString(const std::string& json_text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err) ||
        !detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::ConfigError({}, "Config: " + err);
    }

    return Result::Ok();
}

} // namespace treecopy::config
