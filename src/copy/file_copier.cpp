#include "copy/file_copier.hpp"

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/byte_size.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <span>
#include <vector>

namespace treecopy {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point t0) {
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    double sec = std::chrono::duration<double>(elapsed).count();
    if (sec <= 0.0) sec = 0.001;
    return sec;
}

} // namespace

Result FileCopier::Copy(const std::string& source,
                        const std::string& destination,
                        IProgressSink* sink) const {
    ProgressEmitter progress(sink);
    std::uint64_t copied = 0;

    auto res = Transfer(source, destination, progress, copied);
    if (!res.ok) {
        progress.EmitFailure(res.msg);
        return res;
    }

    progress.Emit(ProgressCompleted{});
    return Result::Ok();
}

Result FileCopier::CopyBytes(const std::string& source,
                             const std::string& destination,
                             std::uint64_t& out_bytes) const {
    ProgressEmitter silent(nullptr);
    return Transfer(source, destination, silent, out_bytes);
}

Result FileCopier::Transfer(const std::string& source,
                            const std::string& destination,
                            ProgressEmitter& progress,
                            std::uint64_t& out_bytes) const {
    out_bytes = 0;
    const auto t0 = std::chrono::steady_clock::now();

    FileReader reader;
    auto rr = FileReader::Open(source, reader);
    if (!rr.ok) return rr;

    FileWriter writer;
    auto wr = FileWriter::Open(destination, writer);
    if (!wr.ok) return wr;

    progress.Emit(ProgressStarted{.total_bytes = reader.TotalSize().value_or(0), .total_files = 1});

    const std::size_t chunk = opt_.chunk_size_bytes == 0 ? kDefaultChunkSize
                                                         : std::min(opt_.chunk_size_bytes, kMaxChunkSize);
    std::vector<std::uint8_t> buf(chunk);
    Sha256Hasher hasher;

    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            return Result::IoError(
                e, source, "Read failed: " + source + " (" + std::string(std::strerror(e)) + ")");
        }

        const auto data = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        auto w = writer.WriteAll(data);
        if (!w.ok) return w;
        if (opt_.verify) hasher.Update(data);

        out_bytes += static_cast<std::uint64_t>(n);
        progress.Emit(ProgressAdvanced{.bytes_processed = out_bytes});
    }

    if (opt_.preserve_mode) {
        auto m = writer.SetMode(reader.Mode());
        if (!m.ok) return m;
    }
    if (opt_.fsync) {
        auto fs = writer.FsyncNow();
        if (!fs.ok) return fs;
    }
    auto cl = writer.Close();
    if (!cl.ok) return cl;

    if (opt_.verify) {
        const std::string expected = hasher.FinalHex();
        std::string actual;
        auto h = Sha256HexFile(destination, actual);
        if (!h.ok) return h;
        if (expected.empty() || expected != actual) {
            return Result::IoError(EIO,
                                   destination,
                                   "Verification failed: " + destination + " (sha256 expected=" +
                                       expected + " actual=" + actual + ")");
        }
    }

    const double sec = SecondsSince(t0);
    LogDebug("Copied %s -> %s: %s in %.2fs (%s/s)",
             source.c_str(),
             destination.c_str(),
             FormatByteSize(out_bytes).c_str(),
             sec,
             FormatByteSize(static_cast<std::uint64_t>(static_cast<double>(out_bytes) / sec)).c_str());
    return Result::Ok();
}

} // namespace treecopy
