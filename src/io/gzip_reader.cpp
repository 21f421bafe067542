#include "io/gzip_reader.hpp"

#include <algorithm>
#include <climits>
#include <cstring>

namespace chunkio {

namespace {

constexpr std::size_t kInputBufferSize = 16384;
constexpr std::size_t kMaxOriginalName = 256;

std::string ZlibMessage(const z_stream& strm, const char* fallback) {
    return std::string("gzip: ") + (strm.msg ? strm.msg : fallback);
}

} // namespace

GzipReader::GzipReader(IReader& source)
    : source_(source), in_buffer_(kInputBufferSize), name_buffer_(kMaxOriginalName) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;
}

GzipReader::~GzipReader() { Close(); }

void GzipReader::Close() {
    if (initialized_) {
        inflateEnd(&strm_);
        initialized_ = false;
    }
}

Result GzipReader::Open(IReader& source, std::unique_ptr<GzipReader>& out) {
    std::unique_ptr<GzipReader> gz(new GzipReader(source));

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&gz->strm_, 16 + MAX_WBITS) != Z_OK) {
        return Result::Fail(Errc::DecompressionInit, ZlibMessage(gz->strm_, "inflateInit2 failed"));
    }
    gz->initialized_ = true;

    if (auto r = gz->ReadHeader(); !r.ok) {
        return r;
    }

    out = std::move(gz);
    return Result::Ok();
}

int GzipReader::FillInput() {
    if (strm_.avail_in > 0) return 1;
    if (source_drained_) return 0;

    const ssize_t n = source_.Read(in_buffer_);
    if (n < 0) {
        const std::string why = source_.LastError();
        last_error_ = "gzip: source read failed" + (why.empty() ? std::string() : ": " + why);
        return -1;
    }
    if (n == 0) {
        source_drained_ = true;
        return 0;
    }
    strm_.next_in = in_buffer_.data();
    strm_.avail_in = static_cast<uInt>(n);
    return 1;
}

Result GzipReader::ReadHeader() {
    header_ = gz_header{};
    header_.name = name_buffer_.data();
    header_.name_max = static_cast<uInt>(name_buffer_.size());
    if (inflateGetHeader(&strm_, &header_) != Z_OK) {
        return Result::Fail(Errc::DecompressionInit, ZlibMessage(strm_, "cannot track header"));
    }

    // Header fields need no output space; inflate stops once it wants to emit.
    std::uint8_t sink = 0;
    while (header_.done == 0 && !member_done_) {
        const int f = FillInput();
        if (f < 0) {
            return Result::Fail(Errc::DecompressionInit, last_error_);
        }
        if (f == 0) {
            return Result::Fail(Errc::DecompressionInit, "gzip: unexpected end of stream in header");
        }

        strm_.next_out = &sink;
        strm_.avail_out = 0;
        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
            break;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Result::Fail(Errc::DecompressionInit, ZlibMessage(strm_, "invalid header"));
        }
    }

    original_name_.assign(reinterpret_cast<const char*>(name_buffer_.data()),
                          ::strnlen(reinterpret_cast<const char*>(name_buffer_.data()),
                                    name_buffer_.size()));
    return Result::Ok();
}

ssize_t GzipReader::Fail(std::string msg) {
    last_error_ = std::move(msg);
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (!initialized_) return Fail("gzip: read on closed stream");
    if (eof_reached_ || out.empty()) return 0;

    const uInt want = static_cast<uInt>(std::min<std::size_t>(out.size(), UINT_MAX));
    strm_.next_out = out.data();
    strm_.avail_out = want;

    bool truncated = false;
    while (strm_.avail_out > 0) {
        if (member_done_) {
            // Another member may follow the trailer.
            const int f = FillInput();
            if (f < 0) return -1;
            if (f == 0) {
                eof_reached_ = true;
                break;
            }
            if (inflateReset(&strm_) != Z_OK) {
                return Fail(ZlibMessage(strm_, "inflateReset failed"));
            }
            member_done_ = false;
        }

        // Running dry is not an error yet: zlib may still hold pending output.
        if (FillInput() < 0) return -1;

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
            continue;
        }
        if (ret == Z_BUF_ERROR) {
            if (strm_.avail_in == 0 && source_drained_) {
                truncated = true;
                break;
            }
            continue;
        }
        if (ret != Z_OK) {
            return Fail(ZlibMessage(strm_, "corrupt data"));
        }
    }

    const std::size_t produced = want - strm_.avail_out;
    if (produced == 0 && truncated) {
        return Fail("gzip: unexpected end of stream");
    }
    return static_cast<ssize_t>(produced);
}

} // namespace chunkio
