#pragma once
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace treecopy::config {

inline constexpr const char* kDefaultConfigPath = "/etc/treecopy/treecopy.conf";

// Settings read from a JSON object. Keys that are absent stay unset so the
// command line and built-in defaults can fill them in.
class TreecopyConfigFromFile {
public:
    std::optional<std::uint64_t> chunk_size_bytes;
    std::optional<std::uint64_t> channel_capacity;
    std::optional<bool> progress;
    std::optional<std::string> progress_file;
    std::optional<bool> verify;
    std::optional<bool> preserve_mode;
    std::optional<bool> fsync;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string &path);
    Result LoadString(const std::string &json_text);

    void Reset();
};

} // namespace treecopy::config
