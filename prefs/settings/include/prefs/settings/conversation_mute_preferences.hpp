#pragma once

#include <prefs/settings/settings_accessor.hpp>
#include <prefs/store/store_registry.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <string>

namespace prefs::settings {

// Per-conversation mute state in the "conversation_mute" store.
// Each muted conversation has a "mute_<address>" key holding the epoch
// millisecond timestamp the mute lasts until; ALWAYS never expires.
class ConversationMutePreferences {
public:
    static constexpr const char* STORE_NAME = "conversation_mute";

    struct MuteDuration {
        static constexpr int64_t ONE_HOUR = 60LL * 60LL * 1000LL;
        static constexpr int64_t ONE_DAY = 24LL * ONE_HOUR;
        static constexpr int64_t ONE_WEEK = 7LL * ONE_DAY;
        static constexpr int64_t ALWAYS = std::numeric_limits<int64_t>::max();
    };

    // Returns the current time in epoch milliseconds
    using Clock = std::function<int64_t()>;

    explicit ConversationMutePreferences(std::shared_ptr<store::PreferenceStore> store,
                                         Clock clock = system_clock_millis);
    explicit ConversationMutePreferences(store::StoreRegistry& registry,
                                         Clock clock = system_clock_millis);

    static Setting<int64_t> mute_setting(const std::string& address);
    static int64_t system_clock_millis();

    std::future<void> mute_until(const std::string& address, int64_t until_ms) const;
    std::future<void> mute_for(const std::string& address, int64_t duration_ms) const;
    std::future<void> unmute(const std::string& address) const;

    // True while the mute is active. An expired mute is removed from the store.
    std::future<bool> is_muted(const std::string& address) const;

    store::ValueStream<bool> is_muted_flow(const std::string& address) const;

    // 0 when the conversation is not muted
    store::ValueStream<int64_t> mute_until_flow(const std::string& address) const;

private:
    static bool is_active(int64_t until_ms, int64_t now_ms);

    SettingsAccessor m_accessor;
    Clock m_clock;
};

} // namespace prefs::settings
