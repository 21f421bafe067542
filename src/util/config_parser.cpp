#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace chunkio::config {

void ChunkstatConfigFromFile::Reset() {
    log_level.reset();
    delimiter.reset();
    max_record_bytes.reset();
}

Result ChunkstatConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(Errc::OpenFailure, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(Errc::ReadFailure, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace chunkio::config
