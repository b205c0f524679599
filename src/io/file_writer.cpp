// file_writer.cpp - Writer for copy destinations.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace treecopy {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    return Fd::Open(out.path_, O_WRONLY | O_CREAT | O_TRUNC, 0644, "destination", out.fd_);
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? EIO : errno;
        return Result::IoError(
            e, path_, "Write failed: " + path_ + " (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::IoError(
            e, path_, "fsync failed: " + path_ + " (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result FileWriter::SetMode(mode_t mode) {
    if (::fchmod(fd_.Get(), mode) == -1) {
        const int e = errno;
        return Result::IoError(
            e, path_, "chmod failed: " + path_ + " (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (fd_.Close() == -1) {
        const int e = errno;
        return Result::IoError(
            e, path_, "close failed: " + path_ + " (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace treecopy
