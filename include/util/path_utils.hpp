#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace treecopy {

inline std::string JoinPath(std::string_view base, std::string_view rel) {
    if (rel.empty()) return std::string(base);
    return (std::filesystem::path(base) / std::filesystem::path(rel)).string();
}

inline std::string FileNameOf(std::string_view path) {
    return std::filesystem::path(path).filename().string();
}

// Express `path` relative to `root`, comparing whole components after lexical
// normalization. "." and trailing separators are ignored; a path equal to the
// root yields an empty string. Anything outside the root is a PathError.
inline Result RelativeTo(std::string_view root, std::string_view path, std::string& out_relative) {
    out_relative.clear();

    const std::filesystem::path norm_root = std::filesystem::path(root).lexically_normal();
    const std::filesystem::path norm_path = std::filesystem::path(path).lexically_normal();

    auto r = norm_root.begin();
    auto p = norm_path.begin();
    while (r != norm_root.end()) {
        if (r->empty() || *r == ".") {
            ++r;
            continue;
        }
        if (p == norm_path.end() || *r != *p) {
            return Result::PathError(std::string(path),
                                     "path " + std::string(path) + " is not under " + std::string(root));
        }
        ++r;
        ++p;
    }

    std::filesystem::path rel;
    for (; p != norm_path.end(); ++p) {
        if (p->empty() || *p == ".") continue;
        rel /= *p;
    }
    out_relative = rel.string();
    return Result::Ok();
}

} // namespace treecopy
