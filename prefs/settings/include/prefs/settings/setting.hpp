#pragma once

#include <prefs/store/preferences.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace prefs::settings {

template<typename T>
struct ClampRange {
    T min;
    T max;
};

// A named, typed preference with a default and an optional write-time clamp.
template<typename T>
struct Setting {
    store::Key<T> key;
    T default_value;
    std::optional<ClampRange<T>> clamp_range;

    // Stored value, or the default when the key is absent.
    // Stored values are returned as-is, even outside clamp_range.
    T read(const store::Preferences& prefs) const {
        return prefs.get(key).value_or(default_value);
    }

    // Value actually persisted for a requested write
    T sanitize(T value) const {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(value)) {
                throw std::invalid_argument("Setting '" + key.name + "' cannot be NaN");
            }
        }
        if (clamp_range) {
            return std::clamp(value, clamp_range->min, clamp_range->max);
        }
        return value;
    }
};

} // namespace prefs::settings
