#include "walk/tree_walker.hpp"

#include "util/logger.hpp"

#include <system_error>

namespace treecopy {

namespace fs = std::filesystem;

namespace {

Result WalkError(const std::error_code& ec, const fs::path& path, const char* what) {
    return Result::IoError(ec.value(),
                           path.string(),
                           std::string(what) + ": " + path.string() + " (" + ec.message() + ")");
}

} // namespace

Result WalkEntry::FileSize(std::uint64_t& out) const {
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (ec) {
        return WalkError(ec, path_, "Failed to read size");
    }
    out = static_cast<std::uint64_t>(size);
    return Result::Ok();
}

Result TreeWalker::Walk(const std::string& root, const Visitor& visit) const {
    std::error_code ec;
    // The root is resolved through symlinks; everything below it is not.
    const fs::file_status st = fs::status(root, ec);
    if (ec) {
        if (opt_.skip_errors) {
            LogDebug("Walk: skipping unreadable root %s (%s)", root.c_str(), ec.message().c_str());
            return Result::Ok();
        }
        return WalkError(ec, root, "Failed to stat walk root");
    }

    const WalkEntry root_entry(fs::path(root), st.type(), 0);
    auto r = visit(root_entry);
    if (!r.ok) return r;

    if (!root_entry.IsDirectory()) return Result::Ok();
    return WalkDirectory(root_entry.FsPath(), 1, visit);
}

Result TreeWalker::WalkDirectory(const fs::path& dir, int depth, const Visitor& visit) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (opt_.skip_errors) {
            LogDebug("Walk: skipping unreadable directory %s (%s)",
                     dir.c_str(), ec.message().c_str());
            return Result::Ok();
        }
        return WalkError(ec, dir, "Failed to read directory");
    }

    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code st_ec;
        const fs::file_status st = it->symlink_status(st_ec);
        if (st_ec) {
            if (opt_.skip_errors) {
                LogDebug("Walk: skipping %s (%s)", it->path().c_str(), st_ec.message().c_str());
                continue;
            }
            return WalkError(st_ec, it->path(), "Failed to stat entry");
        }

        const WalkEntry entry(it->path(), st.type(), depth);
        auto r = visit(entry);
        if (!r.ok) return r;

        if (opt_.recursive && entry.IsDirectory()) {
            auto sub = WalkDirectory(entry.FsPath(), depth + 1, visit);
            if (!sub.ok) return sub;
        }
    }

    if (ec) {
        if (opt_.skip_errors) {
            LogDebug("Walk: stopped listing %s early (%s)", dir.c_str(), ec.message().c_str());
            return Result::Ok();
        }
        return WalkError(ec, dir, "Failed to read directory");
    }
    return Result::Ok();
}

} // namespace treecopy
