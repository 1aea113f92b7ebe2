#include <prefs/store/store_config.hpp>
#include <prefs/core/filesystem.hpp>
#include <nlohmann/json.hpp>

namespace prefs::store {

using json = nlohmann::json;

bool StoreConfig::load(const std::string& path) {
    auto content = core::FileSystem::read_text(path);
    if (!content || content->empty()) {
        core::log(core::LogLevel::Warn, "[StoreConfig] Could not open config file: {}", path);
        return false;
    }

    try {
        json j = json::parse(*content);
        StoreConfig loaded = *this;

        loaded.directory = j.value("directory", loaded.directory);
        loaded.file_extension = j.value("file_extension", loaded.file_extension);
        loaded.pretty_print = j.value("pretty_print", loaded.pretty_print);

        if (j.contains("storage")) {
            std::string storage_name = j["storage"].get<std::string>();
            if (storage_name == "file") {
                loaded.storage = StorageKind::File;
            } else if (storage_name == "memory") {
                loaded.storage = StorageKind::Memory;
            } else {
                core::log(core::LogLevel::Warn, "[StoreConfig] Unknown storage '{}', keeping default", storage_name);
            }
        }

        if (j.contains("log_level")) {
            std::string level_name = j["log_level"].get<std::string>();
            if (!core::parse_log_level(level_name, loaded.log_level)) {
                core::log(core::LogLevel::Warn, "[StoreConfig] Unknown log level '{}', keeping default", level_name);
            }
        }

        *this = loaded;
        core::log(core::LogLevel::Info, "[StoreConfig] Loaded config from: {}", path);
        return true;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Error, "[StoreConfig] Failed to load config: {}", e.what());
        return false;
    }
}

bool StoreConfig::save(const std::string& path) const {
    json j = {
        {"directory", directory},
        {"file_extension", file_extension},
        {"pretty_print", pretty_print},
        {"storage", storage == StorageKind::Memory ? "memory" : "file"},
        {"log_level", core::log_level_name(log_level)}
    };

    if (!core::FileSystem::write_text(path, j.dump(4))) {
        core::log(core::LogLevel::Error, "[StoreConfig] Could not open config file for writing: {}", path);
        return false;
    }
    return true;
}

} // namespace prefs::store
