#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chunkio::config {

inline constexpr const char* kDefaultConfigPath = "/etc/chunkio/chunkstat.json";

// Settings for chunkstat. Keys absent from the file stay unset so that the
// command line and built-in defaults can fill them.
class ChunkstatConfigFromFile {
public:
    std::optional<LogLevel> log_level;
    std::optional<char> delimiter;
    std::optional<std::uint64_t> max_record_bytes;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace chunkio::config
