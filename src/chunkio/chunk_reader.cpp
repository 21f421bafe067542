#include "chunkio/chunk_reader.hpp"

#include "io/content_sniffer.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace chunkio {

ReaderCleanup& ReaderCleanup::operator=(ReaderCleanup&& other) noexcept {
    if (this != &other) {
        (*this)();
        source_ = std::move(other.source_);
        gzip_ = std::move(other.gzip_);
    }
    return *this;
}

ReaderCleanup::~ReaderCleanup() { (*this)(); }

void ReaderCleanup::operator()() {
    if (gzip_) {
        gzip_->Close();
        gzip_.reset();
    }
    source_.reset();
}

ChunkReader::ChunkReader(std::string name) : name_(std::move(name)) {}

Result ChunkReader::Open(std::string name,
                         std::unique_ptr<ChunkReader>& out,
                         ReaderCleanup& cleanup) {
    auto file = std::make_unique<FileOrStdinReader>();
    if (auto r = FileOrStdinReader::Open(std::move(name), *file); !r.ok) {
        return r;
    }
    std::string display = file->Name();
    return FromSource(std::move(file), std::move(display), out, cleanup);
}

Result ChunkReader::FromSource(std::unique_ptr<IReader> source,
                               std::string name,
                               std::unique_ptr<ChunkReader>& out,
                               ReaderCleanup& cleanup) {
    if (!source) {
        return Result::Fail(Errc::OpenFailure, "no source for " + name);
    }

    // Owns the layers until the reader is handed out.
    ReaderCleanup local;
    local.source_ = std::move(source);

    std::unique_ptr<ChunkReader> rd(new ChunkReader(std::move(name)));

    IReader* gzip_input = nullptr;
    if (FileExtension(rd->name_) == kGzipExtension) {
        LogDebug("%s: gzip by extension", rd->name_.c_str());
        gzip_input = local.source_.get();
    } else {
        rd->raw_buffered_ = std::make_unique<BufferedReader>(*local.source_);

        // A failing source is sniffed on what it delivered; the error is
        // reported by the first read.
        std::span<const std::uint8_t> head;
        if (const Result peek = rd->raw_buffered_->Peek(kSniffLen, head); !peek.ok && !peek.is_eof()) {
            LogDebug("%s: sniffing stopped early: %s", rd->name_.c_str(), peek.msg.c_str());
        }

        const ContentType type = DetectContentType(head);
        LogDebug("%s: sniffed %zu bytes as %s", rd->name_.c_str(), head.size(), ContentTypeName(type));
        if (type == ContentType::kGzip) {
            gzip_input = rd->raw_buffered_.get();
        } else {
            if (IsUnsupportedCompression(type)) {
                LogWarn("%s: content looks like %s, only gzip is decompressed",
                        rd->name_.c_str(),
                        ContentTypeName(type));
            }
            rd->rd_ = rd->raw_buffered_.get();
        }
    }

    if (gzip_input) {
        if (auto r = GzipReader::Open(*gzip_input, local.gzip_); !r.ok) {
            return Result::Fail(Errc::DecompressionInit, rd->name_ + ": " + r.msg);
        }
        if (!local.gzip_->OriginalName().empty()) {
            LogDebug("%s: gzip member name %s", rd->name_.c_str(), local.gzip_->OriginalName().c_str());
        }
        rd->decoded_buffered_ = std::make_unique<BufferedReader>(*local.gzip_);
        rd->rd_ = rd->decoded_buffered_.get();
        rd->compressed_ = true;
    }

    cleanup = std::move(local);
    out = std::move(rd);
    return Result::Ok();
}

std::string ChunkReader::Where() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), ":%" PRIu64 " (offset %" PRIu64 ")", line_ + 1, offset_);
    return name_ + buf;
}

template <typename Bytes>
void ChunkReader::Advance(const Bytes& bytes) {
    offset_ += bytes.size();
    line_ += static_cast<std::uint64_t>(std::count(bytes.begin(), bytes.end(), '\n'));
}

Result ChunkReader::ReadUntil(std::uint8_t delim, std::vector<std::uint8_t>& out) {
    prior_ = Position{offset_, line_};

    Result r = rd_->ReadUntil(delim, out);
    Advance(out);
    return r;
}

Result ChunkReader::ReadUntilAsText(char delim, std::string& out) {
    prior_ = Position{offset_, line_};

    Result r = rd_->ReadUntil(delim, out);
    Advance(out);
    return r;
}

Result ChunkReader::SkipUntil(std::uint8_t delim, std::uint64_t& skipped) {
    prior_ = Position{offset_, line_};
    skipped = 0;

    std::vector<std::uint8_t> piece;
    while (true) {
        Result r = rd_->ReadUntil(delim, piece, rd_->Size());
        Advance(piece);
        skipped += piece.size();
        if (!r.ok || (!piece.empty() && piece.back() == delim)) {
            return r;
        }
    }
}

Result ChunkReader::ReadChar(char32_t& ch, int& width) {
    prior_ = Position{offset_, line_};

    Result r = rd_->ReadRune(ch, width);
    offset_ += static_cast<std::uint64_t>(width);
    if (ch == U'\n') {
        ++line_;
    }
    return r;
}

Result ChunkReader::UnreadChar() {
    if (!prior_) {
        return Result::Fail(Errc::UndoFailure, name_ + ": nothing to unread");
    }
    const Position p = *prior_;
    prior_.reset();

    if (auto r = rd_->UnreadRune(); !r.ok) {
        return Result::Fail(Errc::UndoFailure, name_ + ": " + r.msg);
    }
    offset_ = p.offset;
    line_ = p.line;
    return Result::Ok();
}

} // namespace chunkio
