#include <prefs/settings/app_preferences.hpp>

namespace prefs::settings {

AppPreferences::AppPreferences(std::shared_ptr<store::PreferenceStore> store)
    : m_accessor(std::move(store)) {}

AppPreferences::AppPreferences(store::StoreRegistry& registry)
    : m_accessor(registry.get(STORE_NAME)) {}

// ============================================================================
// Delivery Reports
// ============================================================================

store::ValueStream<bool> AppPreferences::delivery_reports_flow() const {
    return m_accessor.observe(DELIVERY_REPORTS);
}

std::future<bool> AppPreferences::get_delivery_reports() const {
    return m_accessor.get_once(DELIVERY_REPORTS);
}

std::future<void> AppPreferences::set_delivery_reports(bool enabled) const {
    return m_accessor.set(DELIVERY_REPORTS, enabled);
}

// ============================================================================
// MMS Auto-download
// ============================================================================

store::ValueStream<bool> AppPreferences::mms_auto_download_wifi_flow() const {
    return m_accessor.observe(MMS_AUTO_DOWNLOAD_WIFI);
}

std::future<bool> AppPreferences::get_mms_auto_download_wifi() const {
    return m_accessor.get_once(MMS_AUTO_DOWNLOAD_WIFI);
}

std::future<void> AppPreferences::set_mms_auto_download_wifi(bool enabled) const {
    return m_accessor.set(MMS_AUTO_DOWNLOAD_WIFI, enabled);
}

store::ValueStream<bool> AppPreferences::mms_auto_download_cellular_flow() const {
    return m_accessor.observe(MMS_AUTO_DOWNLOAD_CELLULAR);
}

std::future<bool> AppPreferences::get_mms_auto_download_cellular() const {
    return m_accessor.get_once(MMS_AUTO_DOWNLOAD_CELLULAR);
}

std::future<void> AppPreferences::set_mms_auto_download_cellular(bool enabled) const {
    return m_accessor.set(MMS_AUTO_DOWNLOAD_CELLULAR, enabled);
}

// ============================================================================
// Do Not Disturb
// ============================================================================

store::ValueStream<bool> AppPreferences::bypass_dnd_flow() const {
    return m_accessor.observe(BYPASS_DND);
}

std::future<bool> AppPreferences::get_bypass_dnd() const {
    return m_accessor.get_once(BYPASS_DND);
}

std::future<void> AppPreferences::set_bypass_dnd(bool enabled) const {
    return m_accessor.set(BYPASS_DND, enabled);
}

// ============================================================================
// Text Size
// ============================================================================

store::ValueStream<float> AppPreferences::text_size_scale_flow() const {
    return m_accessor.observe(TEXT_SIZE_SCALE);
}

std::future<float> AppPreferences::get_text_size_scale() const {
    return m_accessor.get_once(TEXT_SIZE_SCALE);
}

std::future<void> AppPreferences::set_text_size_scale(float scale) const {
    return m_accessor.set(TEXT_SIZE_SCALE, scale);
}

} // namespace prefs::settings
