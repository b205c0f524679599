#pragma once

#include "copy/progress.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace treecopy {

// Writes the latest state as a JSON object to `path`, replacing it atomically
// through a ".tmp" sibling. Send() fails once the file cannot be written.
class FileProgressSink final : public IProgressSink {
public:
    explicit FileProgressSink(std::string path);

    bool Send(const ProgressEvent& e) override;

private:
    bool WriteState(const char* state, const std::string& message);

    std::string path_;
    std::uint64_t total_bytes_ = 0;
    std::size_t total_files_ = 0;
    std::uint64_t done_bytes_ = 0;
};

// Redraws a single stderr line per event.
class ConsoleProgressSink final : public IProgressSink {
public:
    explicit ConsoleProgressSink(std::string label) : label_(std::move(label)) {}

    bool Send(const ProgressEvent& e) override;

private:
    std::string label_;
    std::uint64_t total_bytes_ = 0;
    std::size_t total_files_ = 0;
};

} // namespace treecopy
