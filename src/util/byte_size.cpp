#include "util/byte_size.hpp"

#include <cctype>
#include <cstdio>
#include <limits>

namespace treecopy {

namespace {
constexpr std::uint64_t kUnit = 1000;
constexpr const char kUnitPrefixes[] = "KMGTPE";
} // namespace

std::string FormatByteSize(std::uint64_t bytes) {
    if (bytes < kUnit) {
        return std::to_string(bytes) + " B";
    }

    int exp = 0;
    std::uint64_t divisor = 1;
    while (exp < 6 && bytes / divisor >= kUnit) {
        divisor *= kUnit;
        ++exp;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(divisor),
                  kUnitPrefixes[exp - 1]);
    return buf;
}

std::expected<std::uint64_t, std::string> ParseByteCount(std::string_view text) {
    size_t i = 0;
    std::uint64_t value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        const std::uint64_t digit = static_cast<std::uint64_t>(text[i] - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::unexpected("byte count overflows: " + std::string(text));
        }
        value = value * 10 + digit;
        ++i;
    }
    if (i == 0) {
        return std::unexpected("invalid byte count: " + std::string(text));
    }

    std::string suffix;
    for (; i < text.size(); ++i) {
        suffix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i]))));
    }

    std::uint64_t mult = 1;
    if (suffix.empty() || suffix == "B") {
        mult = 1;
    } else if (suffix == "K" || suffix == "KIB") {
        mult = 1024ULL;
    } else if (suffix == "M" || suffix == "MIB") {
        mult = 1024ULL * 1024ULL;
    } else if (suffix == "G" || suffix == "GIB") {
        mult = 1024ULL * 1024ULL * 1024ULL;
    } else {
        return std::unexpected("invalid byte count suffix: " + std::string(text));
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / mult) {
        return std::unexpected("byte count overflows: " + std::string(text));
    }
    return value * mult;
}

} // namespace treecopy
