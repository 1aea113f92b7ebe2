#pragma once

#include <prefs/store/errors.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace prefs::store {

// ============================================================================
// Values
// ============================================================================

using PreferenceValue = std::variant<bool, int32_t, int64_t, float, double, std::string>;
using PreferenceMap = std::map<std::string, PreferenceValue>;

template<typename T>
inline constexpr bool is_preference_type_v =
    std::is_same_v<T, bool> ||
    std::is_same_v<T, int32_t> ||
    std::is_same_v<T, int64_t> ||
    std::is_same_v<T, float> ||
    std::is_same_v<T, double> ||
    std::is_same_v<T, std::string>;

// "bool", "int", "long", "float", "double" or "string"
const char* value_type_name(const PreferenceValue& value);

template<typename T>
const char* value_type_name() {
    static_assert(is_preference_type_v<T>, "Unsupported preference type");
    return value_type_name(PreferenceValue{T{}});
}

// ============================================================================
// Typed Keys
// ============================================================================

template<typename T>
struct Key {
    static_assert(is_preference_type_v<T>, "Unsupported preference type");

    std::string name;

    bool operator==(const Key& other) const = default;
};

inline Key<bool> bool_key(std::string name) { return {std::move(name)}; }
inline Key<int32_t> int_key(std::string name) { return {std::move(name)}; }
inline Key<int64_t> long_key(std::string name) { return {std::move(name)}; }
inline Key<float> float_key(std::string name) { return {std::move(name)}; }
inline Key<double> double_key(std::string name) { return {std::move(name)}; }
inline Key<std::string> string_key(std::string name) { return {std::move(name)}; }

namespace detail {

template<typename T>
std::optional<T> lookup(const PreferenceMap& values, const Key<T>& key) {
    auto it = values.find(key.name);
    if (it == values.end()) return std::nullopt;
    if (const T* value = std::get_if<T>(&it->second)) return *value;
    throw PreferenceTypeError(key.name, value_type_name<T>(), value_type_name(it->second));
}

} // namespace detail

class MutablePreferences;

// ============================================================================
// Preferences - immutable snapshot of a store
// ============================================================================

class Preferences {
public:
    Preferences() = default;
    explicit Preferences(PreferenceMap values) : m_values(std::move(values)) {}

    // Absent key -> std::nullopt. Wrong stored type -> PreferenceTypeError.
    template<typename T>
    std::optional<T> get(const Key<T>& key) const { return detail::lookup(m_values, key); }

    bool contains(const std::string& name) const { return m_values.contains(name); }
    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    const PreferenceMap& values() const { return m_values; }

    MutablePreferences to_mutable() const;

    bool operator==(const Preferences& other) const = default;

private:
    PreferenceMap m_values;
};

// ============================================================================
// MutablePreferences - working copy handed to edit transforms
// ============================================================================

class MutablePreferences {
public:
    MutablePreferences() = default;
    explicit MutablePreferences(PreferenceMap values) : m_values(std::move(values)) {}

    template<typename T>
    std::optional<T> get(const Key<T>& key) const { return detail::lookup(m_values, key); }

    template<typename T>
    void set(const Key<T>& key, T value) { m_values[key.name] = std::move(value); }

    template<typename T>
    void remove(const Key<T>& key) { m_values.erase(key.name); }

    void remove(const std::string& name) { m_values.erase(name); }
    void clear() { m_values.clear(); }

    bool contains(const std::string& name) const { return m_values.contains(name); }
    size_t size() const { return m_values.size(); }

    Preferences to_preferences() const { return Preferences(m_values); }

private:
    PreferenceMap m_values;
};

} // namespace prefs::store
