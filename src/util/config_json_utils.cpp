#include "util/config_json_utils.hpp"

#include <fstream>

namespace chunkio::config::detail {

namespace {

// A present key of the wrong type is an error; an absent one is not.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ChunkstatConfigFromFile& cfg, std::string& err) {
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "LogLevel", s, err))
            return false;
        if (s) {
            LogLevel lvl{};
            if (!ParseLogLevel(*s, lvl)) {
                err = "unknown LogLevel '" + *s + "'";
                return false;
            }
            cfg.log_level = lvl;
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "Delimiter", s, err))
            return false;
        if (s) {
            if (s->size() != 1) {
                err = "Delimiter must be exactly one character";
                return false;
            }
            cfg.delimiter = s->front();
        }
    }
    if (!GetU64IfPresent(j, "MaxRecordBytes", cfg.max_record_bytes, err))
        return false;

    return true;
}

} // namespace chunkio::config::detail
