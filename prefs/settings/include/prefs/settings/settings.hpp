#pragma once

// ============================================================================
// Preferences Settings - Umbrella Header
// ============================================================================
//
// Typed user settings on top of prefs::store.
//
// Quick Start:
// ------------
// 1. Build the registry once and inject it:
//    store::StoreRegistry registry(config);
//    AppPreferences app(registry);
//
// 2. One-shot read and write:
//    bool dnd = app.get_bypass_dnd().get();
//    app.set_text_size_scale(1.2f).get();
//
// 3. Observe:
//    auto scale = app.text_size_scale_flow();
//    while (auto value = scale.next()) { apply_scale(*value); }
//
// ============================================================================

#include <prefs/settings/setting.hpp>
#include <prefs/settings/settings_accessor.hpp>
#include <prefs/settings/app_preferences.hpp>
#include <prefs/settings/conversation_mute_preferences.hpp>
