#pragma once

#include <cstdarg>
#include <expected>
#include <string>
#include <string_view>

namespace treecopy {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error" and "none" in any case.
std::expected<LogLevel, std::string> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Tag printed on every line logged from the calling thread, e.g. the copy
    // worker. nullptr clears it. The string must outlive the thread's logging.
    static void SetThreadTag(const char* tag);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

// The single redrawn stderr status line. Writes share the logger's lock, and a
// log message first ends an active line so the two never share a row.
enum class ProgressLine {
    Redraw,   // "\r" + text, line stays open
    Finish,   // "\r" + text + newline
    Message,  // ends an open line, then text + newline
};
void WriteProgressLine(ProgressLine kind, const std::string& text);
bool IsProgressLineActive();
void ClearProgressLine();

#define LogDebug(...) ::treecopy::Logger::Instance().LogWithSource(::treecopy::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::treecopy::Logger::Instance().LogWithSource(::treecopy::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::treecopy::Logger::Instance().LogWithSource(::treecopy::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::treecopy::Logger::Instance().LogWithSource(::treecopy::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace treecopy
