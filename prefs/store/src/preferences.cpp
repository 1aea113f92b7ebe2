#include <prefs/store/preferences.hpp>

namespace prefs::store {

const char* value_type_name(const PreferenceValue& value) {
    switch (value.index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "long";
        case 3: return "float";
        case 4: return "double";
        case 5: return "string";
        default: return "unknown";
    }
}

MutablePreferences Preferences::to_mutable() const {
    return MutablePreferences(m_values);
}

} // namespace prefs::store
