#pragma once
#include <string>
#include <utility>

namespace treecopy {

enum class ErrorKind : int {
    None = 0,
    Io,
    Path,
    Pattern,
    Config,
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};
    // Offending file or directory, empty when the failure is not tied to one.
    std::string path;

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result IoError(int e, std::string p, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::Io, .path = std::move(p)};
    }
    static Result PathError(std::string p, std::string m) {
        return {.ok = false, .err = -1, .msg = std::move(m), .kind = ErrorKind::Path, .path = std::move(p)};
    }
    static Result PatternError(std::string m) {
        return {.ok = false, .err = -1, .msg = std::move(m), .kind = ErrorKind::Pattern};
    }
    static Result ConfigError(std::string p, std::string m) {
        return {.ok = false, .err = -1, .msg = std::move(m), .kind = ErrorKind::Config, .path = std::move(p)};
    }
};

} // namespace treecopy
