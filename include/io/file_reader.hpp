#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace chunkio {

inline constexpr const char* kStdinDisplayName = "/dev/stdin";

class FileOrStdinReader final : public IReader {
public:
    // "-" binds standard input; Name() then reports "/dev/stdin".
    static Result Open(std::string path, FileOrStdinReader &out);

    const std::string& Name() const { return path_; }
    bool IsStdin() const { return fd_.IsStdin(); }

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string LastError() const override { return last_error_; }

private:
    std::string path_;
    Fd fd_;
    std::string last_error_;
};

} // namespace chunkio
