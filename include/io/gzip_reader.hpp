#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace chunkio {

// Streaming gzip decoder over a borrowed source. Concatenated members are
// decoded as one stream. The source must outlive the reader.
class GzipReader final : public IReader {
  public:
    // Parses the first member header before returning, so a corrupt or
    // empty input fails here with Errc::DecompressionInit.
    static Result Open(IReader& source, std::unique_ptr<GzipReader>& out);

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;
    ~GzipReader() override;

    // Implementation of IReader
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string LastError() const override { return last_error_; }

    // Original file name stored in the first member header, if any.
    const std::string& OriginalName() const { return original_name_; }

    // Releases the inflate state. Later reads fail.
    void Close();

  private:
    explicit GzipReader(IReader& source);

    Result ReadHeader();
    // 1 when input is pending, 0 once the source is exhausted, -1 on error.
    int FillInput();
    ssize_t Fail(std::string msg);

    IReader& source_;
    z_stream strm_{};
    gz_header header_{};
    std::vector<std::uint8_t> in_buffer_;
    std::vector<unsigned char> name_buffer_;
    std::string original_name_;
    std::string last_error_;
    bool initialized_ = false;
    bool member_done_ = false;
    bool source_drained_ = false;
    bool eof_reached_ = false;
};

} // namespace chunkio
