#include "copy/progress_sinks.hpp"

#include "util/byte_size.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

namespace treecopy {

namespace {
int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 100;
    int pct = static_cast<int>((done * 100ULL) / total);
    if (pct > 100) pct = 100;
    return pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

bool FileProgressSink::Send(const ProgressEvent& e) {
    return std::visit(
        [this](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, ProgressStarted>) {
                total_bytes_ = ev.total_bytes;
                total_files_ = ev.total_files;
                done_bytes_ = 0;
                return WriteState("started", {});
            } else if constexpr (std::is_same_v<T, ProgressAdvanced>) {
                done_bytes_ = ev.bytes_processed;
                return WriteState("running", {});
            } else if constexpr (std::is_same_v<T, ProgressCompleted>) {
                done_bytes_ = total_bytes_;
                return WriteState("completed", {});
            } else {
                return WriteState("failed", ev.message);
            }
        },
        e);
}

bool FileProgressSink::WriteState(const char* state, const std::string& message) {
    nlohmann::json j;
    j["state"] = state;
    j["percent"] = Percent(done_bytes_, total_bytes_);
    j["bytes_processed"] = done_bytes_;
    j["total_bytes"] = total_bytes_;
    j["total_files"] = total_files_;
    if (!message.empty()) {
        j["message"] = message;
    }

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return false;
    os << j.dump();
    os.close();
    if (!os.good())
        return false;

    return std::rename(tmp_path.c_str(), path_.c_str()) == 0;
}

bool ConsoleProgressSink::Send(const ProgressEvent& e) {
    char line[512];
    if (const auto* started = std::get_if<ProgressStarted>(&e)) {
        total_bytes_ = started->total_bytes;
        total_files_ = started->total_files;
        std::snprintf(line, sizeof(line), "[%s] %3d%% | 0 B / %s | %zu file(s)",
                      label_.c_str(),
                      Percent(0, total_bytes_),
                      FormatByteSize(total_bytes_).c_str(),
                      total_files_);
        WriteProgressLine(ProgressLine::Redraw, line);
    } else if (const auto* advanced = std::get_if<ProgressAdvanced>(&e)) {
        std::snprintf(line, sizeof(line), "[%s] %3d%% | %s / %s | %zu file(s)",
                      label_.c_str(),
                      Percent(advanced->bytes_processed, total_bytes_),
                      FormatByteSize(advanced->bytes_processed).c_str(),
                      FormatByteSize(total_bytes_).c_str(),
                      total_files_);
        WriteProgressLine(ProgressLine::Redraw, line);
    } else if (std::holds_alternative<ProgressCompleted>(e)) {
        std::snprintf(line, sizeof(line), "[%s] 100%% | %s | %zu file(s) done",
                      label_.c_str(),
                      FormatByteSize(total_bytes_).c_str(),
                      total_files_);
        WriteProgressLine(ProgressLine::Finish, line);
    } else if (const auto* failed = std::get_if<ProgressFailed>(&e)) {
        WriteProgressLine(ProgressLine::Message, "[" + label_ + "] failed: " + failed->message);
    }
    return true;
}

} // namespace treecopy
