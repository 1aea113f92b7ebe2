#include <prefs/store/store_registry.hpp>
#include <prefs/core/log.hpp>
#include <filesystem>
#include <stdexcept>

namespace prefs::store {

namespace fs = std::filesystem;

StoreRegistry::StoreRegistry(StoreConfig config)
    : m_config(std::move(config)) {}

StoreRegistry::~StoreRegistry() {
    close_all();
}

StoreRegistry StoreRegistry::in_memory() {
    StoreConfig config;
    config.storage = StorageKind::Memory;
    return StoreRegistry(std::move(config));
}

std::shared_ptr<PreferenceStore> StoreRegistry::get(const std::string& name) {
    validate_name(name);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stores.find(name);
    if (it != m_stores.end()) {
        return it->second;
    }

    auto store = PreferenceStore::create(name, make_backend(name));
    m_stores.emplace(name, store);
    core::log(core::LogLevel::Debug, "[StoreRegistry] Opened store '{}'", name);
    return store;
}

std::string StoreRegistry::path_for(const std::string& name) const {
    fs::path file = fs::path(m_config.directory) / (name + m_config.file_extension);
    return file.string();
}

void StoreRegistry::close_all() {
    std::unordered_map<std::string, std::shared_ptr<PreferenceStore>> stores;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stores.swap(m_stores);
    }

    for (auto& [name, store] : stores) {
        store->close();
    }
}

size_t StoreRegistry::open_store_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stores.size();
}

void StoreRegistry::validate_name(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("StoreRegistry::get requires a store name");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
        name == "." || name == "..") {
        throw std::invalid_argument("Invalid store name: " + name);
    }
}

std::unique_ptr<IStorageBackend> StoreRegistry::make_backend(const std::string& name) const {
    if (m_config.storage == StorageKind::Memory) {
        return std::make_unique<MemoryBackend>();
    }
    return std::make_unique<JsonFileBackend>(path_for(name), m_config.pretty_print);
}

} // namespace prefs::store
