#include <prefs/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace prefs::core {

namespace fs = std::filesystem;

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> FileSystem::read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    if (file.bad()) return std::nullopt;
    return content;
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) return false;
    file << text;
    return file.good();
}

bool FileSystem::write_text_atomic(const std::string& path, const std::string& text, std::string& error) {
    std::error_code ec;

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            error = "cannot create directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "cannot open " + temp_path + " for writing";
            return false;
        }
        file << text;
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp_path, ec);
            error = "short write to " + temp_path;
            return false;
        }
    }

    // Atomic rename: replace target file with temp file
    fs::rename(temp_path, path, ec);
    if (ec) {
        error = "cannot rename " + temp_path + ": " + ec.message();
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        return false;
    }

    return true;
}

} // namespace prefs::core
