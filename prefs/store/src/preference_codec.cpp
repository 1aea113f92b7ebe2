#include <prefs/store/preference_codec.hpp>
#include <cmath>
#include <limits>
#include <type_traits>

namespace prefs::store {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string& key, const std::string& reason) {
    throw StoreError("Malformed preference '" + key + "': " + reason);
}

PreferenceValue decode_value(const std::string& key, const std::string& type, const json& value) {
    if (type == "bool") {
        if (!value.is_boolean()) malformed(key, "expected a boolean");
        return value.get<bool>();
    }
    if (type == "int") {
        if (!value.is_number_integer()) malformed(key, "expected an integer");
        int64_t wide = value.get<int64_t>();
        if (wide < std::numeric_limits<int32_t>::min() || wide > std::numeric_limits<int32_t>::max()) {
            malformed(key, "integer out of 32-bit range");
        }
        return static_cast<int32_t>(wide);
    }
    if (type == "long") {
        if (!value.is_number_integer()) malformed(key, "expected an integer");
        if (value.is_number_unsigned() &&
            value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            malformed(key, "integer out of 64-bit range");
        }
        return value.get<int64_t>();
    }
    if (type == "float") {
        if (!value.is_number()) malformed(key, "expected a number");
        double wide = value.get<double>();
        if (std::abs(wide) > std::numeric_limits<float>::max()) {
            malformed(key, "float out of range");
        }
        return static_cast<float>(wide);
    }
    if (type == "double") {
        if (!value.is_number()) malformed(key, "expected a number");
        return value.get<double>();
    }
    if (type == "string") {
        if (!value.is_string()) malformed(key, "expected a string");
        return value.get<std::string>();
    }
    malformed(key, "unknown type '" + type + "'");
}

// JSON has no encoding for inf/NaN (nlohmann writes null)
template<typename T>
void check_encodable(const std::string& key, const T& value) {
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) {
            throw StoreError("Cannot encode preference '" + key + "': value is not finite");
        }
    }
}

} // anonymous namespace

json encode_preferences(const PreferenceMap& values) {
    json document = json::object();

    for (const auto& [key, value] : values) {
        json entry;
        entry["type"] = value_type_name(value);
        std::visit([&entry, &key](const auto& v) {
            check_encodable(key, v);
            entry["value"] = v;
        }, value);
        document[key] = std::move(entry);
    }

    return document;
}

PreferenceMap decode_preferences(const json& document) {
    if (!document.is_object()) {
        throw StoreError("Preference document must be a JSON object");
    }

    PreferenceMap values;
    for (const auto& [key, entry] : document.items()) {
        if (!entry.is_object() || !entry.contains("type") || !entry.contains("value")) {
            malformed(key, "entry needs 'type' and 'value'");
        }
        const json& type = entry["type"];
        if (!type.is_string()) malformed(key, "'type' must be a string");

        values.emplace(key, decode_value(key, type.get<std::string>(), entry["value"]));
    }

    return values;
}

} // namespace prefs::store
