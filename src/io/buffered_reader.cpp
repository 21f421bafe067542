#include "io/buffered_reader.hpp"

#include "util/utf8.hpp"

#include <algorithm>
#include <cstdint>

namespace chunkio {

namespace {
constexpr std::size_t kMinBufferSize = 16;
} // namespace

BufferedReader::BufferedReader(IReader& source, std::size_t size)
    : source_(source), buf_(std::max(size, kMinBufferSize)) {}

std::span<const std::uint8_t> BufferedReader::Window() const {
    return std::span<const std::uint8_t>(buf_.data() + r_, w_ - r_);
}

void BufferedReader::Fill() {
    // Slide unread bytes to the front.
    if (r_ > 0) {
        std::copy(buf_.begin() + static_cast<std::ptrdiff_t>(r_),
                  buf_.begin() + static_cast<std::ptrdiff_t>(w_),
                  buf_.begin());
        w_ -= r_;
        r_ = 0;
    }
    if (w_ >= buf_.size()) return;

    const ssize_t n = source_.Read(std::span<std::uint8_t>(buf_.data() + w_, buf_.size() - w_));
    if (n < 0) {
        const std::string why = source_.LastError();
        err_ = Result::Fail(Errc::ReadFailure, why.empty() ? "read failed" : why);
        return;
    }
    if (n == 0) {
        err_ = Result::Eof();
        return;
    }
    w_ += static_cast<std::size_t>(n);
}

Result BufferedReader::TakeError() {
    Result e = std::move(err_);
    err_ = Result::Ok();
    if (!e.ok && !e.is_eof()) {
        last_error_ = e.msg;
    }
    return e;
}

Result BufferedReader::Peek(std::size_t n, std::span<const std::uint8_t>& out) {
    last_rune_size_ = -1;

    while (w_ - r_ < n && w_ - r_ < buf_.size() && !HasError()) {
        Fill();
    }

    if (n > buf_.size()) {
        out = Window();
        return Result::Fail(Errc::ReadFailure, "peek larger than buffer");
    }

    // The error stays pending for the read that reaches it.
    const std::size_t avail = w_ - r_;
    if (avail < n) {
        out = Window();
        return err_;
    }
    out = Window().first(n);
    return Result::Ok();
}

ssize_t BufferedReader::Read(std::span<std::uint8_t> out) {
    last_rune_size_ = -1;
    if (out.empty()) return 0;

    if (r_ == w_) {
        if (HasError()) {
            const Result e = TakeError();
            return e.is_eof() ? 0 : -1;
        }
        if (out.size() >= buf_.size()) {
            // Large read into an empty buffer: skip the copy.
            const ssize_t n = source_.Read(out);
            if (n < 0) last_error_ = source_.LastError();
            return n;
        }
        r_ = w_ = 0;
        Fill();
        if (r_ == w_) {
            const Result e = TakeError();
            return e.is_eof() ? 0 : -1;
        }
    }

    const std::size_t n = std::min(out.size(), w_ - r_);
    std::copy_n(buf_.begin() + static_cast<std::ptrdiff_t>(r_), n, out.begin());
    r_ += n;
    return static_cast<ssize_t>(n);
}

template <typename Out>
Result BufferedReader::CollectUntil(std::uint8_t delim, Out& out, std::size_t limit) {
    out.clear();
    last_rune_size_ = -1;

    while (true) {
        const std::size_t take = std::min(w_ - r_, limit - out.size());
        const auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(r_);
        const auto end = begin + static_cast<std::ptrdiff_t>(take);
        const auto it = std::find(begin, end, delim);
        if (it != end) {
            out.insert(out.end(), begin, it + 1);
            r_ = static_cast<std::size_t>(it - buf_.begin()) + 1;
            return Result::Ok();
        }

        out.insert(out.end(), begin, end);
        r_ += take;
        if (out.size() >= limit) {
            return Result::Ok();
        }
        if (HasError()) {
            return TakeError();
        }
        Fill();
    }
}

Result BufferedReader::ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out) {
    return CollectUntil(delim, out, SIZE_MAX);
}

Result BufferedReader::ReadUntil(char delim, std::string& out) {
    return CollectUntil(static_cast<std::uint8_t>(delim), out, SIZE_MAX);
}

Result BufferedReader::ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out, std::size_t limit) {
    return CollectUntil(delim, out, limit);
}

Result BufferedReader::ReadRune(char32_t& ch, int& width) {
    while (r_ + utf8::kMaxBytes > w_ && !utf8::FullRune(Window()) && !HasError() &&
           w_ - r_ < buf_.size()) {
        Fill();
    }

    last_rune_size_ = -1;
    if (r_ == w_) {
        ch = 0;
        width = 0;
        return TakeError();
    }

    ch = utf8::DecodeRune(Window(), width);
    r_ += static_cast<std::size_t>(width);
    last_rune_size_ = width;
    return Result::Ok();
}

Result BufferedReader::UnreadRune() {
    if (last_rune_size_ < 0 || r_ < static_cast<std::size_t>(last_rune_size_)) {
        return Result::Fail(Errc::UndoFailure, "invalid use of UnreadRune");
    }
    r_ -= static_cast<std::size_t>(last_rune_size_);
    last_rune_size_ = -1;
    return Result::Ok();
}

} // namespace chunkio
