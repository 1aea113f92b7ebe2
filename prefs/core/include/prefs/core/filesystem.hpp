#pragma once

#include <optional>
#include <string>

namespace prefs::core {

struct FileSystem {
    static bool exists(const std::string& path);

    // Returns std::nullopt when the file cannot be opened or read.
    static std::optional<std::string> read_text(const std::string& path);

    static bool write_text(const std::string& path, const std::string& text);

    // Writes to "<path>.tmp" and renames it over `path`, creating the parent
    // directory first. On failure the temp file is removed, `path` is left as
    // it was, and `error` describes what went wrong.
    static bool write_text_atomic(const std::string& path, const std::string& text, std::string& error);
};

} // namespace prefs::core
