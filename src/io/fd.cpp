#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace treecopy {

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        return Result::IoError(e,
                               path,
                               std::string("Failed to open ") + what + ": " + path + " (" +
                                   std::strerror(e) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    if (fd == fd_) return;
    (void)Close();
    fd_ = fd;
}

int Fd::Close() {
    const int fd = Release();
    if (fd < 0) return 0;
    // Linux releases the descriptor even when close(2) fails, so no retry.
    return ::close(fd);
}

} // namespace treecopy
