#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace treecopy {

struct FindOptions {
    // Glob matched against the file name; no pattern lists every regular file.
    std::optional<std::string> pattern;
    bool recursive = true;
    bool case_sensitive = true;
};

// Unreadable entries are skipped. Only regular files are reported.
Result FindFiles(const std::string& root, const FindOptions& opt, std::vector<std::string>& out);

// ECMAScript regex searched anywhere in the file name; always recursive.
Result FindFilesRegex(const std::string& root,
                      const std::string& regex_pattern,
                      std::vector<std::string>& out);

// Sum of the sizes of all regular files below root.
Result DirectorySize(const std::string& root, std::uint64_t& out);
Result DirectorySizeHuman(const std::string& root, std::string& out);

// fnmatch(3) based glob. An unterminated bracket expression is rejected.
class GlobPattern {
  public:
    static Result Compile(const std::string& pattern, bool case_sensitive, GlobPattern& out);

    bool Matches(const std::string& file_name) const;

  private:
    std::string pattern_;
    bool case_sensitive_ = true;
};

} // namespace treecopy
