#pragma once

#include "io/buffered_reader.hpp"
#include "io/gzip_reader.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkio {

inline constexpr const char* kGzipExtension = ".gz";

// Release action paired with a ChunkReader. It owns the raw source and the
// gzip stream; the reader only borrows them and must not be used once this
// has run. Closes the gzip stream before the source. Running it again is a
// no-op, and destruction runs it if the caller did not.
class ReaderCleanup {
  public:
    ReaderCleanup() = default;
    ReaderCleanup(ReaderCleanup&& other) noexcept = default;
    ReaderCleanup& operator=(ReaderCleanup&& other) noexcept;
    ReaderCleanup(const ReaderCleanup&) = delete;
    ReaderCleanup& operator=(const ReaderCleanup&) = delete;
    ~ReaderCleanup();

    void operator()();

    // True while there is something left to release.
    bool Armed() const { return source_ != nullptr || gzip_ != nullptr; }

  private:
    friend class ChunkReader;

    std::unique_ptr<IReader> source_;
    std::unique_ptr<GzipReader> gzip_;
};

// Buffered reader over a file, standard input or any IReader, decompressing
// gzip content transparently and counting the bytes and newlines handed out.
// Not thread-safe.
class ChunkReader {
  public:
    struct Position {
        std::uint64_t offset = 0;
        std::uint64_t line = 0;
    };

    // Opens a path, or standard input for "-". Gzip is attached when the name
    // ends in ".gz" (without looking at the content) or when the first bytes
    // sniff as gzip.
    // Errors: Errc::OpenFailure, Errc::DecompressionInit.
    static Result Open(std::string name, std::unique_ptr<ChunkReader>& out, ReaderCleanup& cleanup);

    // Same detection over an already acquired source. name is used for the
    // extension check and for diagnostics.
    static Result FromSource(std::unique_ptr<IReader> source,
                             std::string name,
                             std::unique_ptr<ChunkReader>& out,
                             ReaderCleanup& cleanup);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    // Bytes handed out so far (decompressed bytes for gzip input).
    std::uint64_t Offset() const { return offset_; }
    // Newlines handed out so far.
    std::uint64_t LineCount() const { return line_; }
    bool Compressed() const { return compressed_; }
    const std::string& Name() const { return name_; }

    // "<name>:<line> (offset <n>)" for the current position, line 1-based.
    std::string Where() const;

    // Bytes up to and including delim. At the end of the stream the
    // remaining bytes (possibly none) come back with Errc::EndOfStream, so
    // check out before the result.
    Result ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out);
    Result ReadUntilAsText(char delim, std::string& out);

    // Like ReadUntil, but the bytes are counted into skipped instead of being
    // kept, at most one buffer at a time.
    Result SkipUntil(std::uint8_t delim, std::uint64_t& skipped);

    // One UTF-8 character. width is its encoded length, 0 at end of stream.
    Result ReadChar(char32_t& ch, int& width);

    // Undoes the ReadChar immediately before it, counters included.
    // Errc::UndoFailure otherwise, e.g. after a ReadUntil or a second undo.
    Result UnreadChar();

  private:
    explicit ChunkReader(std::string name);

    template <typename Bytes>
    void Advance(const Bytes& bytes);

    std::string name_;
    std::unique_ptr<BufferedReader> raw_buffered_;
    std::unique_ptr<BufferedReader> decoded_buffered_;
    BufferedReader* rd_ = nullptr;
    std::uint64_t offset_ = 0; // start of stream is offset 0
    std::uint64_t line_ = 0;   // first line is number 0
    bool compressed_ = false;
    std::optional<Position> prior_;
};

} // namespace chunkio
