#include "copy/directory_copier.hpp"

#include "util/byte_size.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "walk/tree_walker.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace treecopy {

namespace {

Result CreateDirectories(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result::IoError(
            ec.value(), dir, "Failed to create directory: " + dir + " (" + ec.message() + ")");
    }
    return Result::Ok();
}

// Prefixes the phase so callers can tell a listing failure from a copy failure.
Result InPhase(Result r, const std::string& phase) {
    r.msg = phase + ": " + r.msg;
    return r;
}

} // namespace

Result DirectoryCopier::BuildPlan(const std::string& source_root, CopyPlan& out) {
    out = CopyPlan{};

    TreeWalker walker(TreeWalker::Options{.recursive = true, .skip_errors = false});
    return walker.Walk(source_root, [&](const WalkEntry& entry) -> Result {
        if (!entry.IsRegularFile()) return Result::Ok();

        std::uint64_t size = 0;
        auto sr = entry.FileSize(size);
        if (!sr.ok) return sr;

        std::string relative;
        auto rr = RelativeTo(source_root, entry.Path(), relative);
        if (!rr.ok) return rr;
        if (relative.empty()) {
            return Result::PathError(entry.Path(),
                                     "source root is a file, not a directory: " + entry.Path());
        }

        out.tasks.push_back(CopyTask{
            .source_path = entry.Path(),
            .relative_path = std::move(relative),
            .size = size,
        });
        out.total_bytes += size;
        ++out.total_files;
        return Result::Ok();
    });
}

Result DirectoryCopier::Copy(const std::string& source_root,
                             const std::string& destination_root,
                             IProgressSink* sink) const {
    ProgressEmitter progress(sink);
    const auto t0 = std::chrono::steady_clock::now();

    auto dr = CreateDirectories(destination_root);
    if (!dr.ok) return InPhase(std::move(dr), "listing");

    CopyPlan plan;
    auto pr = BuildPlan(source_root, plan);
    if (!pr.ok) return InPhase(std::move(pr), "listing");

    LogDebug("Listed %zu file(s), %s under %s",
             plan.total_files,
             FormatByteSize(plan.total_bytes).c_str(),
             source_root.c_str());

    progress.Emit(ProgressStarted{.total_bytes = plan.total_bytes, .total_files = plan.total_files});

    auto cr = CopyPlanned(plan, destination_root, progress);
    if (!cr.ok) {
        progress.EmitFailure(cr.msg);
        return cr;
    }

    progress.Emit(ProgressCompleted{});

    double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    if (sec <= 0.0) sec = 0.001;
    LogInfo("Copied %zu file(s), %s in %.2fs (%s/s): %s -> %s",
            plan.total_files,
            FormatByteSize(plan.total_bytes).c_str(),
            sec,
            FormatByteSize(static_cast<std::uint64_t>(static_cast<double>(plan.total_bytes) / sec)).c_str(),
            source_root.c_str(),
            destination_root.c_str());
    return Result::Ok();
}

Result DirectoryCopier::CopyPlanned(const CopyPlan& plan,
                                    const std::string& destination_root,
                                    ProgressEmitter& progress) const {
    std::uint64_t done_bytes = 0;
    std::size_t index = 0;

    for (const auto& task : plan.tasks) {
        ++index;
        const std::string phase =
            "copying file " + std::to_string(index) + "/" + std::to_string(plan.total_files);

        const std::string target = JoinPath(destination_root, task.relative_path);
        const std::string parent = std::filesystem::path(target).parent_path().string();
        if (!parent.empty()) {
            auto mk = CreateDirectories(parent);
            if (!mk.ok) return InPhase(std::move(mk), phase);
        }

        std::uint64_t copied = 0;
        auto r = file_copier_.CopyBytes(task.source_path, target, copied);
        if (!r.ok) return InPhase(std::move(r), phase);
        if (copied != task.size) {
            LogWarn("%s changed size during copy (listed %llu, copied %llu bytes)",
                    task.source_path.c_str(),
                    (unsigned long long)task.size,
                    (unsigned long long)copied);
        }

        // Listed sizes keep the running total consistent with Started.
        done_bytes += task.size;
        progress.Emit(ProgressAdvanced{.bytes_processed = done_bytes});
    }

    return Result::Ok();
}

} // namespace treecopy
