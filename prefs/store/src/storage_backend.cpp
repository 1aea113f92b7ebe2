#include <prefs/store/storage_backend.hpp>
#include <prefs/store/preference_codec.hpp>
#include <prefs/core/filesystem.hpp>
#include <prefs/core/log.hpp>
#include <nlohmann/json.hpp>

namespace prefs::store {

using json = nlohmann::json;

// ============================================================================
// JsonFileBackend
// ============================================================================

JsonFileBackend::JsonFileBackend(std::string path, bool pretty_print)
    : m_path(std::move(path))
    , m_pretty_print(pretty_print) {}

PreferenceMap JsonFileBackend::read() {
    if (!core::FileSystem::exists(m_path)) {
        core::log(core::LogLevel::Debug, "[JsonFileBackend] No file at {}, starting empty", m_path);
        return {};
    }

    auto content = core::FileSystem::read_text(m_path);
    if (!content) {
        throw StoreError("Cannot read preference file " + m_path);
    }
    if (content->empty()) {
        return {};
    }

    try {
        return decode_preferences(json::parse(*content));
    } catch (const json::exception& e) {
        throw StoreError("Corrupt preference file " + m_path + ": " + e.what());
    }
}

void JsonFileBackend::write(const PreferenceMap& values) {
    std::string text;
    try {
        json document = encode_preferences(values);
        text = m_pretty_print ? document.dump(4) : document.dump();
    } catch (const json::exception& e) {
        throw StoreError("Cannot encode preferences for " + m_path + ": " + e.what());
    }

    std::string error;
    if (!core::FileSystem::write_text_atomic(m_path, text, error)) {
        throw StoreError("Cannot write preference file " + m_path + ": " + error);
    }
}

// ============================================================================
// MemoryBackend
// ============================================================================

PreferenceMap MemoryBackend::read() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values;
}

void MemoryBackend::write(const PreferenceMap& values) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values = values;
    m_write_count++;
}

size_t MemoryBackend::write_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_write_count;
}

} // namespace prefs::store
