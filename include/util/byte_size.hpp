#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace treecopy {

// Decimal units: "15 B", "1.5 KB", "2.0 MB", ... up to "EB".
std::string FormatByteSize(std::uint64_t bytes);

// Parses "65536", "64K", "64KiB", "4M", "1MiB", "1G". Suffixes are binary multiples.
std::expected<std::uint64_t, std::string> ParseByteCount(std::string_view text);

} // namespace treecopy
