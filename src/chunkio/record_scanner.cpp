#include "chunkio/record_scanner.hpp"

#include <cerrno>
#include <cstring>
#include <string>

namespace chunkio {

Result ScanRecords(ChunkReader& rd,
                   const ScanOptions& opt,
                   ScanStats& stats,
                   const MalformedRecordFn& on_malformed) {
    const auto delim = static_cast<std::uint8_t>(opt.delimiter);

    while (true) {
        const ChunkReader::Position start{rd.Offset(), rd.LineCount()};
        std::uint64_t consumed = 0;
        const Result r = rd.SkipUntil(delim, consumed);

        if (consumed > 0) {
            ++stats.records;
            std::uint64_t length = consumed;
            // Ok means the record ended on its delimiter.
            if (r.ok) --length;
            if (opt.max_record_bytes > 0 && length > opt.max_record_bytes) {
                ++stats.malformed;
                if (on_malformed) on_malformed(start, length);
            }
        }

        if (r.is_eof()) return Result::Ok();
        if (!r.ok) {
            return Result::Fail(r.code, rd.Where() + ": " + r.msg, r.sys_errno);
        }
    }
}

Result CopyDecoded(ChunkReader& rd, std::FILE* out) {
    std::string line;
    while (true) {
        const Result r = rd.ReadUntilAsText('\n', line);

        if (!line.empty() && std::fwrite(line.data(), 1, line.size(), out) != line.size()) {
            const int e = errno;
            return Result::Fail(Errc::ReadFailure, std::string("write failed (") + std::strerror(e) + ")", e);
        }

        if (r.is_eof()) break;
        if (!r.ok) {
            return Result::Fail(r.code, rd.Where() + ": " + r.msg, r.sys_errno);
        }
    }

    if (std::fflush(out) != 0) {
        const int e = errno;
        return Result::Fail(Errc::ReadFailure, std::string("flush failed (") + std::strerror(e) + ")", e);
    }
    return Result::Ok();
}

} // namespace chunkio
