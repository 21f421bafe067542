#pragma once

#include <string>
#include <string_view>

namespace chunkio {

inline bool IsStdinName(std::string_view s) {
    return s == "-";
}

// Extension of the last path element, dot included:
// - "a/b.tar.gz" -> ".gz"
// - "a.d/file"   -> ""
// - "file."      -> "."
inline std::string FileExtension(std::string_view path) {
    for (std::size_t i = path.size(); i > 0; --i) {
        const char c = path[i - 1];
        if (c == '/') break;
        if (c == '.') return std::string(path.substr(i - 1));
    }
    return {};
}

} // namespace chunkio
