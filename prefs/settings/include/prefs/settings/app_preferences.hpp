#pragma once

#include <prefs/settings/settings_accessor.hpp>
#include <prefs/store/store_registry.hpp>
#include <future>
#include <memory>

namespace prefs::settings {

// ============================================================================
// AppPreferences
// ============================================================================
//
// Messaging preferences kept in the "app_preferences" store.
//
// | Setting                      | Key                          | Default |
// |------------------------------|------------------------------|---------|
// | Delivery reports             | delivery_reports_enabled     | false   |
// | MMS auto-download (Wi-Fi)    | mms_auto_download_wifi       | true    |
// | MMS auto-download (cellular) | mms_auto_download_cellular   | false   |
// | Bypass do-not-disturb        | bypass_dnd                   | false   |
// | Text size scale              | text_size_scale              | 1.0     |
//
// Text size scale is clamped to [0.7, 1.6] on write only.
//
// ============================================================================

class AppPreferences {
public:
    static constexpr const char* STORE_NAME = "app_preferences";

    static constexpr float TEXT_SIZE_SCALE_MIN = 0.7f;
    static constexpr float TEXT_SIZE_SCALE_MAX = 1.6f;

    static inline const Setting<bool> DELIVERY_REPORTS{
        store::bool_key("delivery_reports_enabled"), false, std::nullopt};
    static inline const Setting<bool> MMS_AUTO_DOWNLOAD_WIFI{
        store::bool_key("mms_auto_download_wifi"), true, std::nullopt};
    // Off by default to save mobile data
    static inline const Setting<bool> MMS_AUTO_DOWNLOAD_CELLULAR{
        store::bool_key("mms_auto_download_cellular"), false, std::nullopt};
    static inline const Setting<bool> BYPASS_DND{
        store::bool_key("bypass_dnd"), false, std::nullopt};
    static inline const Setting<float> TEXT_SIZE_SCALE{
        store::float_key("text_size_scale"), 1.0f,
        ClampRange<float>{TEXT_SIZE_SCALE_MIN, TEXT_SIZE_SCALE_MAX}};

    explicit AppPreferences(std::shared_ptr<store::PreferenceStore> store);
    explicit AppPreferences(store::StoreRegistry& registry);

    // Delivery reports
    store::ValueStream<bool> delivery_reports_flow() const;
    std::future<bool> get_delivery_reports() const;
    std::future<void> set_delivery_reports(bool enabled) const;

    // MMS auto-download on Wi-Fi
    store::ValueStream<bool> mms_auto_download_wifi_flow() const;
    std::future<bool> get_mms_auto_download_wifi() const;
    std::future<void> set_mms_auto_download_wifi(bool enabled) const;

    // MMS auto-download on cellular
    store::ValueStream<bool> mms_auto_download_cellular_flow() const;
    std::future<bool> get_mms_auto_download_cellular() const;
    std::future<void> set_mms_auto_download_cellular(bool enabled) const;

    // Bypass do-not-disturb for notifications
    store::ValueStream<bool> bypass_dnd_flow() const;
    std::future<bool> get_bypass_dnd() const;
    std::future<void> set_bypass_dnd(bool enabled) const;

    // Text size scale
    store::ValueStream<float> text_size_scale_flow() const;
    std::future<float> get_text_size_scale() const;
    std::future<void> set_text_size_scale(float scale) const;

    const SettingsAccessor& accessor() const { return m_accessor; }

private:
    SettingsAccessor m_accessor;
};

} // namespace prefs::settings
