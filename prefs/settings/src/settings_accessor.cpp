#include <prefs/settings/settings_accessor.hpp>
#include <stdexcept>

namespace prefs::settings {

SettingsAccessor::SettingsAccessor(std::shared_ptr<store::PreferenceStore> store)
    : m_store(std::move(store)) {
    if (!m_store) {
        throw std::invalid_argument("SettingsAccessor requires a valid store");
    }
}

} // namespace prefs::settings
