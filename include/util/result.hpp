#pragma once
#include <string>
#include <utility>

namespace chunkio {

enum class Errc : int {
    Ok = 0,
    OpenFailure,
    DecompressionInit,
    EndOfStream,
    UndoFailure,
    ReadFailure,
};

struct Result {
    bool ok{true};
    Errc code{Errc::Ok};
    int sys_errno{0};
    std::string msg;

    bool is_eof() const { return code == Errc::EndOfStream; }

    static Result Ok() { return {}; }
    static Result Eof() { return {.ok = false, .code = Errc::EndOfStream, .sys_errno = 0, .msg = "EOF"}; }
    static Result Fail(Errc c, std::string m, int e = 0) {
        return {.ok = false, .code = c, .sys_errno = e, .msg = std::move(m)};
    }
};

} // namespace chunkio
