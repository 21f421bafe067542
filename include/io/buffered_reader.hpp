#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chunkio {

// Fixed-size lookahead buffer over a borrowed source. Errors from the source
// are held until the buffered bytes before them have been handed out, then
// reported once.
class BufferedReader final : public IReader {
  public:
    static constexpr std::size_t kDefaultSize = 4096;

    explicit BufferedReader(IReader& source, std::size_t size = kDefaultSize);

    BufferedReader(const BufferedReader&) = delete;
    BufferedReader& operator=(const BufferedReader&) = delete;

    // Next n bytes without consuming them. A shorter view comes with the
    // reason: Errc::EndOfStream, Errc::ReadFailure, or a ReadFailure when n
    // exceeds the buffer size. A source error is also returned by the first
    // read that reaches it.
    Result Peek(std::size_t n, std::span<const std::uint8_t>& out);

    // Implementation of IReader
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string LastError() const override { return last_error_; }

    // Bytes up to and including delim. Without delim before the end, out
    // holds the rest of the stream and Errc::EndOfStream is returned.
    Result ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out);
    Result ReadUntil(char delim, std::string& out);
    // Stops after limit bytes as well; Ok with out not ending in delim means
    // the limit was reached first.
    Result ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out, std::size_t limit);

    // One UTF-8 character; invalid encodings yield U+FFFD with width 1.
    Result ReadRune(char32_t& ch, int& width);
    // Only valid directly after a successful ReadRune.
    Result UnreadRune();

    std::size_t Size() const { return buf_.size(); }

  private:
    template <typename Out>
    Result CollectUntil(std::uint8_t delim, Out& out, std::size_t limit);

    void Fill();
    Result TakeError();
    bool HasError() const { return !err_.ok; }
    std::span<const std::uint8_t> Window() const;

    IReader& source_;
    std::vector<std::uint8_t> buf_;
    std::size_t r_ = 0;
    std::size_t w_ = 0;
    Result err_;
    std::string last_error_;
    int last_rune_size_ = -1;
};

} // namespace chunkio
