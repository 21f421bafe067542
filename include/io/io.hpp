#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <sys/types.h>

namespace chunkio {

// Pull-style byte source. Read returns the number of bytes stored in out,
// 0 at end of stream, -1 on error (LastError() then describes it).
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::string LastError() const { return {}; }
};

} // namespace chunkio
