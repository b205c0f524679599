#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace treecopy {

class WalkEntry {
  public:
    WalkEntry(std::filesystem::path path, std::filesystem::file_type type, int depth)
        : path_(std::move(path)), type_(type), depth_(depth) {}

    // Type of the entry itself; symlinks are reported as symlinks, not followed.
    bool IsRegularFile() const { return type_ == std::filesystem::file_type::regular; }
    bool IsDirectory() const { return type_ == std::filesystem::file_type::directory; }
    bool IsSymlink() const { return type_ == std::filesystem::file_type::symlink; }

    std::string Name() const { return path_.filename().string(); }
    std::string Path() const { return path_.string(); }
    const std::filesystem::path& FsPath() const { return path_; }
    int Depth() const { return depth_; }

    // Stats the entry on demand.
    Result FileSize(std::uint64_t& out) const;

  private:
    std::filesystem::path path_;
    std::filesystem::file_type type_;
    int depth_ = 0;
};

// Depth-first, pre-order traversal: the root itself (depth 0), then each
// directory's entries in the order the filesystem returns them, descending into
// a subdirectory right after visiting it. Symlinked directories are not entered.
class TreeWalker {
  public:
    struct Options {
        // false: the root and its direct children only.
        bool recursive = true;
        // Skip entries and directories that cannot be read instead of failing.
        bool skip_errors = false;
    };

    // Returning a failed Result from the visitor stops the walk with that result.
    using Visitor = std::function<Result(const WalkEntry&)>;

    TreeWalker() = default;
    explicit TreeWalker(Options opt) : opt_(opt) {}

    Result Walk(const std::string& root, const Visitor& visit) const;

  private:
    Result WalkDirectory(const std::filesystem::path& dir, int depth, const Visitor& visit) const;

    Options opt_;
};

} // namespace treecopy
