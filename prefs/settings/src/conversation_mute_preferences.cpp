#include <prefs/settings/conversation_mute_preferences.hpp>
#include <prefs/core/log.hpp>
#include <chrono>
#include <exception>
#include <stdexcept>

namespace prefs::settings {

ConversationMutePreferences::ConversationMutePreferences(std::shared_ptr<store::PreferenceStore> store, Clock clock)
    : m_accessor(std::move(store))
    , m_clock(std::move(clock)) {
    if (!m_clock) {
        throw std::invalid_argument("ConversationMutePreferences requires a clock");
    }
}

ConversationMutePreferences::ConversationMutePreferences(store::StoreRegistry& registry, Clock clock)
    : ConversationMutePreferences(registry.get(STORE_NAME), std::move(clock)) {}

Setting<int64_t> ConversationMutePreferences::mute_setting(const std::string& address) {
    return {store::long_key("mute_" + address), 0, std::nullopt};
}

int64_t ConversationMutePreferences::system_clock_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool ConversationMutePreferences::is_active(int64_t until_ms, int64_t now_ms) {
    if (until_ms <= 0) return false;
    return until_ms == MuteDuration::ALWAYS || until_ms > now_ms;
}

std::future<void> ConversationMutePreferences::mute_until(const std::string& address, int64_t until_ms) const {
    return m_accessor.set(mute_setting(address), until_ms);
}

std::future<void> ConversationMutePreferences::mute_for(const std::string& address, int64_t duration_ms) const {
    if (duration_ms < 0) {
        std::promise<void> rejected;
        rejected.set_exception(std::make_exception_ptr(
            std::invalid_argument("Mute duration must not be negative")));
        return rejected.get_future();
    }

    int64_t until_ms = MuteDuration::ALWAYS;
    if (duration_ms != MuteDuration::ALWAYS) {
        int64_t now_ms = m_clock();
        // Saturate instead of overflowing into the past
        if (now_ms > 0 && duration_ms > MuteDuration::ALWAYS - now_ms) {
            until_ms = MuteDuration::ALWAYS;
        } else {
            until_ms = now_ms + duration_ms;
        }
    }
    return mute_until(address, until_ms);
}

std::future<void> ConversationMutePreferences::unmute(const std::string& address) const {
    return m_accessor.reset(mute_setting(address));
}

std::future<bool> ConversationMutePreferences::is_muted(const std::string& address) const {
    auto target = m_accessor.store();
    auto clock = m_clock;
    Setting<int64_t> setting = mute_setting(address);

    return std::async(std::launch::async, [target, clock, setting]() {
        int64_t until_ms = setting.read(*target->data());
        if (until_ms <= 0) return false;
        if (is_active(until_ms, clock())) return true;

        // Expired: drop it unless someone re-muted in the meantime
        target->update_data([&](store::MutablePreferences& prefs) {
            if (prefs.get(setting.key) == until_ms) {
                prefs.remove(setting.key);
            }
        });
        core::log(core::LogLevel::Debug, "[ConversationMute] Cleared expired mute for {}", setting.key.name);
        return false;
    });
}

store::ValueStream<bool> ConversationMutePreferences::is_muted_flow(const std::string& address) const {
    Setting<int64_t> setting = mute_setting(address);
    Clock clock = m_clock;
    return m_accessor.observe_mapped<bool>([setting, clock](const store::Preferences& prefs) {
        return is_active(setting.read(prefs), clock());
    });
}

store::ValueStream<int64_t> ConversationMutePreferences::mute_until_flow(const std::string& address) const {
    return m_accessor.observe(mute_setting(address));
}

} // namespace prefs::settings
