#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace treecopy {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.size_.reset();

    // O_NONBLOCK keeps open(2) from waiting for a writer when the path is a FIFO.
    auto r = Fd::Open(out.path_, O_RDONLY | O_NONBLOCK, 0, "source", out.fd_);
    if (!r.ok) return r;

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        const int e = errno;
        return Result::IoError(
            e, out.path_, "Failed to stat source: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::IoError(EINVAL, out.path_, "Source is not a regular file: " + out.path_);
    }
    const int flags = ::fcntl(out.fd_.Get(), F_GETFL);
    if (flags == -1 || ::fcntl(out.fd_.Get(), F_SETFL, flags & ~O_NONBLOCK) == -1) {
        const int e = errno;
        return Result::IoError(
            e, out.path_, "Failed to configure source: " + out.path_ + " (" + std::strerror(e) + ")");
    }

    out.size_ = static_cast<std::uint64_t>(st.st_size);
    out.mode_ = st.st_mode & 07777;
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace treecopy
