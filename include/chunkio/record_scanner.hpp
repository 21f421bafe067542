#pragma once

#include "chunkio/chunk_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <cstdio>
#include <functional>

namespace chunkio {

struct ScanOptions {
    char delimiter = '\n';
    // Longest accepted record, delimiter excluded. 0 disables the check.
    std::uint64_t max_record_bytes = 0;
};

struct ScanStats {
    std::uint64_t records = 0;
    std::uint64_t malformed = 0;
};

// Called with the position where an oversized record starts and its length.
using MalformedRecordFn = std::function<void(const ChunkReader::Position& at, std::uint64_t length)>;

// Reads delimiter-terminated records to the end of the stream. A final record
// without delimiter still counts. Stops at the first read error.
Result ScanRecords(ChunkReader& rd,
                   const ScanOptions& opt,
                   ScanStats& stats,
                   const MalformedRecordFn& on_malformed = {});

// Writes the decoded stream to out.
Result CopyDecoded(ChunkReader& rd, std::FILE* out);

} // namespace chunkio
