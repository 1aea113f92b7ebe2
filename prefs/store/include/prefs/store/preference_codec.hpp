#pragma once

#include <prefs/store/preferences.hpp>
#include <nlohmann/json.hpp>

namespace prefs::store {

// On-disk layout: one JSON object, each key mapped to
//   { "type": "bool" | "int" | "long" | "float" | "double" | "string", "value": ... }
nlohmann::json encode_preferences(const PreferenceMap& values);

// Throws StoreError when the document does not follow the layout above.
PreferenceMap decode_preferences(const nlohmann::json& document);

} // namespace prefs::store
