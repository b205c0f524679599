#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace treecopy {

// Reader over a regular file. Open() rejects directories, FIFOs and devices.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }
    mode_t Mode() const { return mode_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    mode_t mode_ = 0;
};

} // namespace treecopy
