#include "util/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace treecopy {

namespace {
std::mutex g_write_mu;
std::atomic<LogLevel> g_level{LogLevel::Info};
thread_local const char* t_tag = nullptr;
// Guarded by g_write_mu.
bool g_progress_line_active = false;

constexpr const char* kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

// "2026-01-31 12:00:00", or empty when local time is unavailable.
std::string Timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) return {};
    char buf[32]{};
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

void AppendF(std::string& out, const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return;

    const size_t old = out.size();
    out.resize(old + static_cast<size_t>(n) + 1);
    std::vsnprintf(out.data() + old, static_cast<size_t>(n) + 1, fmt, ap);
    out.resize(old + static_cast<size_t>(n));
}

void EndProgressLineLocked() {
    if (g_progress_line_active) {
        std::fputc('\n', stderr);
        g_progress_line_active = false;
    }
}
} // namespace

std::expected<LogLevel, std::string> ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info")  return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "none")  return LogLevel::None;
    return std::unexpected("unknown log level: " + std::string(name));
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) { g_level.store(lvl); }

LogLevel Logger::Level() const { return g_level.load(); }

void Logger::SetThreadTag(const char* tag) { t_tag = tag; }

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    if (lvl == LogLevel::None || lvl < g_level.load()) return;

    std::string text;
    const std::string ts = Timestamp();
    if (!ts.empty()) {
        text += "[" + ts + "] ";
    }
    text += "[";
    text += kLevelNames[static_cast<int>(lvl)];
    text += "] ";
    if (t_tag) {
        text += "[";
        text += t_tag;
        text += "] ";
    }
    if (file && *file && line > 0) {
        const char* slash = std::strrchr(file, '/');
        text += "[";
        text += slash ? slash + 1 : file;
        text += ":" + std::to_string(line) + "] ";
    }
    AppendF(text, fmt, ap);
    text += '\n';

    std::lock_guard<std::mutex> lk(g_write_mu);
    // A half-drawn progress line would otherwise swallow the start of the message.
    EndProgressLineLocked();
    std::fputs(text.c_str(), stderr);
}

void WriteProgressLine(ProgressLine kind, const std::string& text) {
    std::lock_guard<std::mutex> lk(g_write_mu);
    switch (kind) {
        case ProgressLine::Redraw:
            std::fprintf(stderr, "\r%s", text.c_str());
            g_progress_line_active = true;
            break;
        case ProgressLine::Finish:
            std::fprintf(stderr, "\r%s\n", text.c_str());
            g_progress_line_active = false;
            break;
        case ProgressLine::Message:
            EndProgressLineLocked();
            std::fprintf(stderr, "%s\n", text.c_str());
            break;
    }
    std::fflush(stderr);
}

bool IsProgressLineActive() {
    std::lock_guard<std::mutex> lk(g_write_mu);
    return g_progress_line_active;
}

void ClearProgressLine() {
    std::lock_guard<std::mutex> lk(g_write_mu);
    EndProgressLineLocked();
    std::fflush(stderr);
}

} // namespace treecopy
