#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace chunkio {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

bool Fd::IsStdin() const { return fd_ == STDIN_FILENO; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    const int fd = Release();
    if (fd < 0 || fd == STDIN_FILENO) {
        return 0;
    }
    // close(2) must not be retried on EINTR on Linux; the descriptor is gone.
    if (::close(fd) == -1 && errno != EINTR) {
        return -1;
    }
    return 0;
}

} // namespace chunkio
