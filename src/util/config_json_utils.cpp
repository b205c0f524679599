#include "util/config_json_utils.hpp"

#include "copy/copy_options.hpp"

#include <fstream>

namespace treecopy::config::detail {

namespace {

// The Get*IfPresent helpers return false only for a present key of the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (!it->is_number_integer())
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
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

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, TreecopyConfigFromFile& cfg, std::string& err) {
    if (!GetU64IfPresent(j, "ChunkSizeBytes", cfg.chunk_size_bytes)) {
        err = "ChunkSizeBytes must be a non-negative integer";
        return false;
    }
    if (cfg.chunk_size_bytes && *cfg.chunk_size_bytes == 0) {
        err = "ChunkSizeBytes must be greater than zero";
        return false;
    }
    if (cfg.chunk_size_bytes && *cfg.chunk_size_bytes > kMaxChunkSize) {
        err = "ChunkSizeBytes must not exceed " + std::to_string(kMaxChunkSize);
        return false;
    }
    if (!GetU64IfPresent(j, "ChannelCapacity", cfg.channel_capacity)) {
        err = "ChannelCapacity must be a non-negative integer";
        return false;
    }
    if (!GetBoolIfPresent(j, "Progress", cfg.progress)) {
        err = "Progress must be a boolean";
        return false;
    }
    if (!GetStringIfPresent(j, "ProgressFile", cfg.progress_file)) {
        err = "ProgressFile must be a string";
        return false;
    }
    if (!GetBoolIfPresent(j, "Verify", cfg.verify)) {
        err = "Verify must be a boolean";
        return false;
    }
    if (!GetBoolIfPresent(j, "PreserveMode", cfg.preserve_mode)) {
        err = "PreserveMode must be a boolean";
        return false;
    }
    if (!GetBoolIfPresent(j, "Fsync", cfg.fsync)) {
        err = "Fsync must be a boolean";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level)) {
        err = "LogLevel must be a string";
        return false;
    }
    if (level) {
        auto parsed = ParseLogLevel(*level);
        if (!parsed) {
            err = parsed.error();
            return false;
        }
        cfg.log_level = *parsed;
    }

    return true;
}

} // namespace treecopy::config::detail
