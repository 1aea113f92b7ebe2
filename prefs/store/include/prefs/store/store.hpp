#pragma once

// ============================================================================
// Preference Store - Umbrella Header
// ============================================================================
//
// Durable typed key-value storage with observable snapshots.
//
// Quick Start:
// ------------
// 1. Build a registry once at startup:
//    StoreRegistry registry(config);
//
// 2. Get a store by name (same name -> same store):
//    auto store = registry.get("app_preferences");
//
// 3. Read, write, observe:
//    auto scale = store->data()->get(float_key("text_size_scale"));
//    store->edit([](MutablePreferences& p) { p.set(float_key("text_size_scale"), 1.2f); }).get();
//    ValueStream<bool> dnd(store, [](const Preferences& p) { ... });
//
// ============================================================================

#include <prefs/store/errors.hpp>
#include <prefs/store/preferences.hpp>
#include <prefs/store/preference_codec.hpp>
#include <prefs/store/storage_backend.hpp>
#include <prefs/store/preference_store.hpp>
#include <prefs/store/value_stream.hpp>
#include <prefs/store/store_config.hpp>
#include <prefs/store/store_registry.hpp>
