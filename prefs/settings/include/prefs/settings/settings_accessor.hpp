#pragma once

#include <prefs/settings/setting.hpp>
#include <prefs/store/preference_store.hpp>
#include <prefs/store/value_stream.hpp>
#include <functional>
#include <future>
#include <memory>

namespace prefs::settings {

// ============================================================================
// SettingsAccessor - observe / get_once / set over one PreferenceStore
// ============================================================================

class SettingsAccessor {
public:
    explicit SettingsAccessor(std::shared_ptr<store::PreferenceStore> store);

    // Current value first, then every change. Ends when the store closes or
    // the stream is cancelled.
    template<typename T>
    store::ValueStream<T> observe(const Setting<T>& setting) const {
        return store::ValueStream<T>(m_store, [setting](const store::Preferences& prefs) {
            return setting.read(prefs);
        });
    }

    // Arbitrary projection of the store, for values derived from several keys
    // or from outside state (e.g. a clock).
    template<typename T>
    store::ValueStream<T> observe_mapped(std::function<T(const store::Preferences&)> mapper) const {
        return store::ValueStream<T>(m_store, std::move(mapper));
    }

    // Value the first emission of observe(setting) would carry right now.
    template<typename T>
    std::future<T> get_once(const Setting<T>& setting) const {
        return std::async(std::launch::async, [target = m_store, setting]() {
            return setting.read(*target->data());
        });
    }

    // Persists setting.sanitize(value) for the setting's key only. Completes
    // once the store has durably committed the write.
    template<typename T>
    std::future<void> set(const Setting<T>& setting, T value) const {
        return std::async(std::launch::async, [target = m_store, setting, value]() {
            T sanitized = setting.sanitize(value);
            target->update_data([&](store::MutablePreferences& prefs) {
                prefs.set(setting.key, sanitized);
            });
        });
    }

    // Removes the stored value so reads fall back to the default.
    template<typename T>
    std::future<void> reset(const Setting<T>& setting) const {
        return std::async(std::launch::async, [target = m_store, setting]() {
            target->update_data([&](store::MutablePreferences& prefs) {
                prefs.remove(setting.key);
            });
        });
    }

    const std::shared_ptr<store::PreferenceStore>& store() const { return m_store; }

private:
    std::shared_ptr<store::PreferenceStore> m_store;
};

} // namespace prefs::settings
