#include "io/file_reader.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace chunkio {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.last_error_.clear();

    if (IsStdinName(path)) {
        out.path_ = kStdinDisplayName;
        out.fd_.Reset(STDIN_FILENO);
        return Result::Ok();
    }

    out.path_ = std::move(path);
    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(Errc::OpenFailure,
                            "failed to open input: " + out.path_ + " (" + std::strerror(e) + ")",
                            e);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    if (!fd_.Valid()) {
        last_error_ = path_ + ": read on closed source";
        return -1;
    }
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        last_error_ = path_ + ": read failed (" + std::strerror(errno) + ")";
        return -1;
    }
}

} // namespace chunkio
