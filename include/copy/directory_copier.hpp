#pragma once

#include "copy/copy_options.hpp"
#include "copy/file_copier.hpp"
#include "copy/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace treecopy {

struct CopyTask {
    std::string source_path;
    std::string relative_path;
    std::uint64_t size = 0;
};

struct CopyPlan {
    std::vector<CopyTask> tasks;
    std::uint64_t total_bytes = 0;
    std::size_t total_files = 0;
};

// Two-pass recursive copy. The listing pass collects every regular file under
// the source root with its size; the copy pass then copies exactly those files
// in listing order and reports cumulative progress against the listed totals.
class DirectoryCopier {
  public:
    DirectoryCopier() = default;
    explicit DirectoryCopier(CopyOptions opt) : file_copier_(opt) {}

    // Started{total_bytes, total_files} after the listing, one Advanced after
    // each file, Completed after the last one. On failure: no Completed, files
    // copied so far stay in place.
    Result Copy(const std::string& source_root,
                const std::string& destination_root,
                IProgressSink* sink = nullptr) const;

    // The listing pass on its own. Symlinks and special files are skipped.
    static Result BuildPlan(const std::string& source_root, CopyPlan& out);

  private:
    Result CopyPlanned(const CopyPlan& plan,
                       const std::string& destination_root,
                       ProgressEmitter& progress) const;

    FileCopier file_copier_;
};

} // namespace treecopy
