#pragma once

#include <stdexcept>
#include <string>

namespace prefs::store {

// Storage unavailable, unreadable or malformed file, failed write, closed store.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// A key exists but holds a value of a different type than the one requested.
class PreferenceTypeError : public std::runtime_error {
public:
    PreferenceTypeError(const std::string& key, const std::string& expected, const std::string& actual)
        : std::runtime_error("Preference '" + key + "' holds " + actual + ", expected " + expected)
        , m_key(key) {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

} // namespace prefs::store
