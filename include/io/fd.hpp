#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace treecopy {

// Owns one file descriptor and closes it on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) retried on EINTR. `what` names the role of the file in the
    // error message ("source", "destination").
    static Result Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out);

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Gives up ownership without closing.
    int Release();
    void Reset(int fd);
    // Returns the result of close(2); 0 when nothing was open.
    int Close();

  private:
    int fd_{-1};
};

} // namespace treecopy
