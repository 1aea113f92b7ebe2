#pragma once

#include <prefs/store/preferences.hpp>
#include <mutex>
#include <string>

namespace prefs::store {

// Durable medium behind a PreferenceStore.
// Both operations throw StoreError on failure.
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    virtual PreferenceMap read() = 0;
    virtual void write(const PreferenceMap& values) = 0;

    // Human readable location, used in log messages
    virtual std::string describe() const = 0;
};

// ============================================================================
// JsonFileBackend - one JSON file per store
// ============================================================================

class JsonFileBackend : public IStorageBackend {
public:
    explicit JsonFileBackend(std::string path, bool pretty_print = true);

    // A missing or empty file reads as an empty map.
    PreferenceMap read() override;

    // Writes "<path>.tmp" then renames it over the target.
    void write(const PreferenceMap& values) override;

    std::string describe() const override { return m_path; }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    bool m_pretty_print;
};

// ============================================================================
// MemoryBackend - process-lifetime storage
// ============================================================================

class MemoryBackend : public IStorageBackend {
public:
    MemoryBackend() = default;
    explicit MemoryBackend(PreferenceMap initial) : m_values(std::move(initial)) {}

    PreferenceMap read() override;
    void write(const PreferenceMap& values) override;
    std::string describe() const override { return "<memory>"; }

    size_t write_count() const;

private:
    mutable std::mutex m_mutex;
    PreferenceMap m_values;
    size_t m_write_count = 0;
};

} // namespace prefs::store
