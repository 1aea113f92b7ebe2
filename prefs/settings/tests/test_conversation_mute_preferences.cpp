#include <catch2/catch_test_macros.hpp>
#include <prefs/settings/conversation_mute_preferences.hpp>
#include <prefs/store/storage_backend.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>

using namespace prefs::settings;
using namespace prefs::store;

namespace {

struct FakeClock {
    std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(1'000'000);

    ConversationMutePreferences::Clock fn() const {
        auto shared = now;
        return [shared]() { return shared->load(); };
    }
};

} // namespace

TEST_CASE("ConversationMutePreferences mute lifecycle", "[settings][mute]") {
    auto store = PreferenceStore::create("conversation_mute", std::make_unique<MemoryBackend>());
    FakeClock clock;
    ConversationMutePreferences mutes(store, clock.fn());
    const std::string address = "+15551234567";

    SECTION("Unknown conversation is not muted") {
        REQUIRE_FALSE(mutes.is_muted(address).get());
    }

    SECTION("Timed mute expires and is cleaned up") {
        mutes.mute_for(address, ConversationMutePreferences::MuteDuration::ONE_HOUR).get();
        REQUIRE(store->data()->get(long_key("mute_" + address)) == 1'000'000 + ConversationMutePreferences::MuteDuration::ONE_HOUR);
        REQUIRE(mutes.is_muted(address).get());

        *clock.now += ConversationMutePreferences::MuteDuration::ONE_HOUR + 1;
        REQUIRE_FALSE(mutes.is_muted(address).get());
        REQUIRE_FALSE(store->data()->contains("mute_" + address));
    }

    SECTION("Always never expires") {
        mutes.mute_for(address, ConversationMutePreferences::MuteDuration::ALWAYS).get();
        *clock.now += 100 * ConversationMutePreferences::MuteDuration::ONE_WEEK;
        REQUIRE(mutes.is_muted(address).get());
    }

    SECTION("Unmute removes the key") {
        mutes.mute_until(address, 5'000'000).get();
        mutes.unmute(address).get();
        REQUIRE_FALSE(mutes.is_muted(address).get());
        REQUIRE(store->data()->empty());
    }

    SECTION("Mutes are per conversation") {
        mutes.mute_for(address, ConversationMutePreferences::MuteDuration::ONE_DAY).get();
        REQUIRE_FALSE(mutes.is_muted("+15550000000").get());
    }

    SECTION("Negative durations are rejected through the future") {
        auto future = mutes.mute_for(address, -1);
        REQUIRE_THROWS_AS(future.get(), std::invalid_argument);
        REQUIRE(store->data()->empty());
    }

    SECTION("Long mutes saturate at ALWAYS") {
        *clock.now = ConversationMutePreferences::MuteDuration::ONE_WEEK;
        mutes.mute_for(address, ConversationMutePreferences::MuteDuration::ALWAYS - 1).get();
        REQUIRE(store->data()->get(long_key("mute_" + address)) == ConversationMutePreferences::MuteDuration::ALWAYS);
    }

    SECTION("A clock before the epoch does not overflow") {
        *clock.now = -ConversationMutePreferences::MuteDuration::ONE_DAY;
        mutes.mute_for(address, ConversationMutePreferences::MuteDuration::ALWAYS - 1).get();
        REQUIRE(store->data()->get(long_key("mute_" + address)) ==
                ConversationMutePreferences::MuteDuration::ALWAYS - 1 - ConversationMutePreferences::MuteDuration::ONE_DAY);
    }
}

TEST_CASE("ConversationMutePreferences flows", "[settings][mute][flow]") {
    auto store = PreferenceStore::create("conversation_mute", std::make_unique<MemoryBackend>());
    FakeClock clock;
    ConversationMutePreferences mutes(store, clock.fn());
    const std::string address = "+15551234567";

    auto muted = mutes.is_muted_flow(address);
    auto until = mutes.mute_until_flow(address);

    REQUIRE(muted.next() == false);
    REQUIRE(until.next() == 0);

    mutes.mute_until(address, 2'000'000).get();
    REQUIRE(muted.try_next() == true);
    REQUIRE(until.try_next() == 2'000'000);

    mutes.unmute(address).get();
    REQUIRE(muted.try_next() == false);
    REQUIRE(until.try_next() == 0);
}
