#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>
#include <zlib.h>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/chunkio_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

// Serves data in slices of at most chunk bytes, to exercise short reads.
class MemoryReader final : public chunkio::IReader {
  public:
    explicit MemoryReader(std::string data, size_t chunk = SIZE_MAX)
        : data_(data.begin(), data.end()), chunk_(chunk) {}

    explicit MemoryReader(std::vector<std::uint8_t> data, size_t chunk = SIZE_MAX)
        : data_(std::move(data)), chunk_(chunk) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        ++reads_;
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min({out.size(), data_.size() - pos_, chunk_});
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    size_t Reads() const { return reads_; }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
    size_t chunk_;
    size_t reads_ = 0;
};

// Hands out a prefix, then fails every read.
class FailingReader final : public chunkio::IReader {
  public:
    explicit FailingReader(std::string prefix) : prefix_(std::move(prefix)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= prefix_.size())
            return -1;
        const size_t n = std::min(out.size(), prefix_.size() - pos_);
        std::copy_n(prefix_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::string LastError() const override { return "injected failure"; }

  private:
    std::string prefix_;
    size_t pos_ = 0;
};

inline std::string ReadAll(chunkio::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// Single gzip member holding data.
inline std::vector<std::uint8_t> GzipCompress(const std::string& data) {
    z_stream strm{};
    // 16 + MAX_WBITS writes a gzip wrapper instead of zlib
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())) + 32);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&strm, Z_FINISH);
    const size_t produced = out.size() - strm.avail_out;
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish");
    }
    out.resize(produced);
    return out;
}

inline std::vector<std::uint8_t> Bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        throw std::runtime_error("cannot create " + path);
    }
    os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!os.good()) {
        throw std::runtime_error("cannot write " + path);
    }
}

} // namespace testutil
