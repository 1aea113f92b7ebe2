#pragma once

#include <prefs/core/log.hpp>
#include <string>
#include <cstdint>

namespace prefs::store {

enum class StorageKind : uint8_t {
    File,    // JsonFileBackend under `directory`
    Memory   // MemoryBackend, nothing touches disk
};

struct StoreConfig {
    std::string directory = "datastore";
    std::string file_extension = ".preferences.json";
    bool pretty_print = true;
    StorageKind storage = StorageKind::File;
    core::LogLevel log_level = core::LogLevel::Info;

    // Load from a JSON file. Fields missing from the file keep their current
    // value; returns false (and keeps every field) when the file cannot be
    // read or parsed.
    bool load(const std::string& path);

    // Save to a JSON file
    bool save(const std::string& path) const;
};

} // namespace prefs::store
