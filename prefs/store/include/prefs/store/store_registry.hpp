#pragma once

#include <prefs/store/preference_store.hpp>
#include <prefs/store/store_config.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace prefs::store {

// Hands out one PreferenceStore per name. Build one registry at startup and
// pass it (or the stores it returns) to whatever needs preferences.
class StoreRegistry {
public:
    explicit StoreRegistry(StoreConfig config = {});
    ~StoreRegistry();

    // Registry whose stores live in memory only (tests, previews)
    static StoreRegistry in_memory();

    // Non-copyable
    StoreRegistry(const StoreRegistry&) = delete;
    StoreRegistry& operator=(const StoreRegistry&) = delete;

    // Same name -> same instance. Throws std::invalid_argument for names that
    // are empty or would escape the store directory.
    std::shared_ptr<PreferenceStore> get(const std::string& name);

    // File backing the store `name` (meaningful for StorageKind::File)
    std::string path_for(const std::string& name) const;

    void close_all();
    size_t open_store_count() const;

    const StoreConfig& config() const { return m_config; }

private:
    static void validate_name(const std::string& name);
    std::unique_ptr<IStorageBackend> make_backend(const std::string& name) const;

    StoreConfig m_config;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<PreferenceStore>> m_stores;
};

} // namespace prefs::store
