#pragma once

#include <cstddef>

namespace treecopy {

inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
// Upper bound for a configured chunk; larger values are clamped by the copier.
inline constexpr std::size_t kMaxChunkSize = 64 * 1024 * 1024;

struct CopyOptions {
    // Bytes read and written per step; also the peak buffer size.
    std::size_t chunk_size_bytes = kDefaultChunkSize;
    bool fsync = false;
    bool preserve_mode = false;
    // Re-read the destination and compare its SHA-256 with the bytes read.
    bool verify = false;
};

} // namespace treecopy
