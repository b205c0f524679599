#pragma once

#include "copy/copy_options.hpp"
#include "copy/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace treecopy {

class FileCopier {
public:
    FileCopier() = default;
    explicit FileCopier(CopyOptions opt) : opt_(opt) {}

    // Copies `source` over `destination` (created or truncated). The parent of
    // `destination` must exist. With a sink attached: Started{size, 1}, one
    // Advanced per chunk written, then Completed. A sink that stops accepting
    // events never interrupts the copy.
    Result Copy(const std::string& source,
                const std::string& destination,
                IProgressSink* sink = nullptr) const;

    // Same transfer without events; `out_bytes` receives the number of bytes copied.
    Result CopyBytes(const std::string& source,
                     const std::string& destination,
                     std::uint64_t& out_bytes) const;

private:
    Result Transfer(const std::string& source,
                    const std::string& destination,
                    ProgressEmitter& progress,
                    std::uint64_t& out_bytes) const;

    CopyOptions opt_{};
};

} // namespace treecopy
