#include "walk/file_finder.hpp"

#include "util/byte_size.hpp"
#include "util/logger.hpp"
#include "walk/tree_walker.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <regex>

namespace treecopy {

namespace {

// ASCII only; other bytes, including UTF-8 sequences, are compared unchanged.
std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool HasUnterminatedBracket(const std::string& p) {
    for (size_t i = 0; i < p.size(); ++i) {
        if (p[i] == '\\') {
            ++i;
            continue;
        }
        if (p[i] != '[') continue;

        size_t j = i + 1;
        if (j < p.size() && (p[j] == '!' || p[j] == '^')) ++j;
        // A ']' right after the opening bracket is a literal member.
        if (j < p.size() && p[j] == ']') ++j;
        while (j < p.size() && p[j] != ']') ++j;
        if (j >= p.size()) return true;
        i = j;
    }
    return false;
}

} // namespace

Result GlobPattern::Compile(const std::string& pattern, bool case_sensitive, GlobPattern& out) {
    if (HasUnterminatedBracket(pattern)) {
        return Result::PatternError("Invalid glob pattern (unterminated '['): " + pattern);
    }
    out.case_sensitive_ = case_sensitive;
    out.pattern_ = case_sensitive ? pattern : ToLower(pattern);
    return Result::Ok();
}

bool GlobPattern::Matches(const std::string& file_name) const {
    const std::string candidate = case_sensitive_ ? file_name : ToLower(file_name);
    return ::fnmatch(pattern_.c_str(), candidate.c_str(), 0) == 0;
}

Result FindFiles(const std::string& root, const FindOptions& opt, std::vector<std::string>& out) {
    out.clear();

    std::optional<GlobPattern> glob;
    if (opt.pattern) {
        GlobPattern compiled;
        auto cr = GlobPattern::Compile(*opt.pattern, opt.case_sensitive, compiled);
        if (!cr.ok) return cr;
        glob = std::move(compiled);
    }

    TreeWalker walker(TreeWalker::Options{.recursive = opt.recursive, .skip_errors = true});
    return walker.Walk(root, [&](const WalkEntry& entry) -> Result {
        if (!entry.IsRegularFile()) return Result::Ok();
        if (glob && !glob->Matches(entry.Name())) return Result::Ok();
        out.push_back(entry.Path());
        return Result::Ok();
    });
}

Result FindFilesRegex(const std::string& root,
                      const std::string& regex_pattern,
                      std::vector<std::string>& out) {
    out.clear();

    std::regex re;
    try {
        re = std::regex(regex_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return Result::PatternError("Invalid regex '" + regex_pattern + "': " + e.what());
    }

    TreeWalker walker(TreeWalker::Options{.recursive = true, .skip_errors = true});
    return walker.Walk(root, [&](const WalkEntry& entry) -> Result {
        if (!entry.IsRegularFile()) return Result::Ok();
        const std::string name = entry.Name();
        if (std::regex_search(name, re)) {
            out.push_back(entry.Path());
        }
        return Result::Ok();
    });
}

Result DirectorySize(const std::string& root, std::uint64_t& out) {
    out = 0;

    TreeWalker walker(TreeWalker::Options{.recursive = true, .skip_errors = true});
    return walker.Walk(root, [&](const WalkEntry& entry) -> Result {
        if (!entry.IsRegularFile()) return Result::Ok();
        std::uint64_t size = 0;
        auto sr = entry.FileSize(size);
        if (!sr.ok) {
            LogDebug("Size: skipping %s", sr.msg.c_str());
            return Result::Ok();
        }
        out += size;
        return Result::Ok();
    });
}

Result DirectorySizeHuman(const std::string& root, std::string& out) {
    std::uint64_t size = 0;
    auto r = DirectorySize(root, size);
    if (!r.ok) return r;
    out = FormatByteSize(size);
    LogDebug("%s: %llu bytes (%s)", root.c_str(), (unsigned long long)size, out.c_str());
    return Result::Ok();
}

} // namespace treecopy
