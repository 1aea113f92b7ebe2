#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <prefs/settings/app_preferences.hpp>
#include <prefs/store/storage_backend.hpp>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace prefs::settings;
using namespace prefs::store;
using Catch::Matchers::WithinAbs;

namespace {

std::shared_ptr<PreferenceStore> fresh_store(PreferenceMap initial = {}) {
    return PreferenceStore::create(AppPreferences::STORE_NAME, std::make_unique<MemoryBackend>(std::move(initial)));
}

class FailingWriteBackend : public IStorageBackend {
public:
    PreferenceMap read() override { return {}; }
    void write(const PreferenceMap&) override { throw StoreError("write rejected"); }
    std::string describe() const override { return "<failing>"; }
};

} // namespace

TEST_CASE("AppPreferences defaults", "[settings][app]") {
    AppPreferences app(fresh_store());

    REQUIRE(app.get_delivery_reports().get() == false);
    REQUIRE(app.get_mms_auto_download_wifi().get() == true);
    REQUIRE(app.get_mms_auto_download_cellular().get() == false);
    REQUIRE(app.get_bypass_dnd().get() == false);
    REQUIRE(app.get_text_size_scale().get() == 1.0f);
}

TEST_CASE("AppPreferences persisted keys", "[settings][app]") {
    REQUIRE(AppPreferences::DELIVERY_REPORTS.key.name == "delivery_reports_enabled");
    REQUIRE(AppPreferences::MMS_AUTO_DOWNLOAD_WIFI.key.name == "mms_auto_download_wifi");
    REQUIRE(AppPreferences::MMS_AUTO_DOWNLOAD_CELLULAR.key.name == "mms_auto_download_cellular");
    REQUIRE(AppPreferences::BYPASS_DND.key.name == "bypass_dnd");
    REQUIRE(AppPreferences::TEXT_SIZE_SCALE.key.name == "text_size_scale");
    REQUIRE(std::string(AppPreferences::STORE_NAME) == "app_preferences");
}

TEST_CASE("AppPreferences boolean round trip", "[settings][app]") {
    AppPreferences app(fresh_store());

    for (bool value : {true, false}) {
        app.set_delivery_reports(value).get();
        REQUIRE(app.get_delivery_reports().get() == value);

        app.set_mms_auto_download_wifi(value).get();
        REQUIRE(app.get_mms_auto_download_wifi().get() == value);

        app.set_mms_auto_download_cellular(value).get();
        REQUIRE(app.get_mms_auto_download_cellular().get() == value);

        app.set_bypass_dnd(value).get();
        REQUIRE(app.get_bypass_dnd().get() == value);
    }
}

TEST_CASE("AppPreferences text size clamping", "[settings][app][text_size]") {
    AppPreferences app(fresh_store());

    SECTION("Below range saturates at the minimum") {
        app.set_text_size_scale(0.5f).get();
        REQUIRE(app.get_text_size_scale().get() == 0.7f);
    }

    SECTION("Above range saturates at the maximum") {
        app.set_text_size_scale(2.0f).get();
        REQUIRE(app.get_text_size_scale().get() == 1.6f);
    }

    SECTION("In range is stored unchanged") {
        app.set_text_size_scale(1.2f).get();
        REQUIRE_THAT(app.get_text_size_scale().get(), WithinAbs(1.2f, 1e-6f));
    }

    SECTION("Bounds are inclusive") {
        app.set_text_size_scale(0.7f).get();
        REQUIRE(app.get_text_size_scale().get() == 0.7f);
        app.set_text_size_scale(1.6f).get();
        REQUIRE(app.get_text_size_scale().get() == 1.6f);
    }

    SECTION("NaN is rejected and nothing is written") {
        auto future = app.set_text_size_scale(std::numeric_limits<float>::quiet_NaN());
        REQUIRE_THROWS_AS(future.get(), std::invalid_argument);
        REQUIRE(app.get_text_size_scale().get() == 1.0f);
    }
}

TEST_CASE("AppPreferences returns out-of-range stored values as-is", "[settings][app][text_size]") {
    AppPreferences app(fresh_store({{"text_size_scale", 3.0f}}));
    REQUIRE(app.get_text_size_scale().get() == 3.0f);
}

TEST_CASE("AppPreferences settings are isolated", "[settings][app]") {
    AppPreferences app(fresh_store());

    app.set_bypass_dnd(true).get();
    app.set_text_size_scale(1.5f).get();

    REQUIRE(app.get_delivery_reports().get() == false);
    REQUIRE(app.get_mms_auto_download_wifi().get() == true);
    REQUIRE(app.get_mms_auto_download_cellular().get() == false);
}

TEST_CASE("AppPreferences delivery report scenario", "[settings][app]") {
    AppPreferences app(fresh_store());

    REQUIRE(app.get_delivery_reports().get() == false);
    app.set_delivery_reports(true).get();
    REQUIRE(app.get_delivery_reports().get() == true);
    REQUIRE(app.get_mms_auto_download_wifi().get() == true);
}

TEST_CASE("AppPreferences observation", "[settings][app][flow]") {
    auto store = fresh_store();
    AppPreferences app(store);
    auto flow = app.delivery_reports_flow();

    SECTION("Current value is emitted on subscription") {
        REQUIRE(flow.try_next() == false);
    }

    SECTION("Each change is emitted") {
        REQUIRE(flow.next() == false);
        app.set_delivery_reports(true).get();
        REQUIRE(flow.try_next() == true);
        app.set_delivery_reports(false).get();
        REQUIRE(flow.try_next() == false);
    }

    SECTION("Writes to other settings do not emit") {
        REQUIRE(flow.next() == false);
        app.set_bypass_dnd(true).get();
        app.set_text_size_scale(1.4f).get();
        REQUIRE_FALSE(flow.try_next().has_value());
    }

    SECTION("Repeating a write is idempotent") {
        REQUIRE(flow.next() == false);
        app.set_delivery_reports(true).get();
        app.set_delivery_reports(true).get();
        REQUIRE(flow.try_next() == true);
        REQUIRE_FALSE(flow.try_next().has_value());
        REQUIRE(app.get_delivery_reports().get() == true);
    }

    SECTION("Text size flow emits clamped values") {
        auto scale = app.text_size_scale_flow();
        REQUIRE(scale.next() == 1.0f);
        app.set_text_size_scale(9.0f).get();
        REQUIRE(scale.try_next() == 1.6f);
    }

    SECTION("Cancelled flow receives nothing further") {
        REQUIRE(flow.next() == false);
        flow.cancel();
        app.set_delivery_reports(true).get();
        REQUIRE_FALSE(flow.try_next().has_value());
        REQUIRE(flow.is_closed());
    }

    SECTION("Flow ends when the store closes") {
        REQUIRE(flow.next() == false);
        store->close();
        REQUIRE_FALSE(flow.next().has_value());
    }
}

TEST_CASE("AppPreferences surfaces store failures", "[settings][app][errors]") {
    SECTION("Write failure reaches the caller") {
        AppPreferences app(PreferenceStore::create("app_preferences", std::make_unique<FailingWriteBackend>()));
        REQUIRE_THROWS_AS(app.set_bypass_dnd(true).get(), StoreError);
        REQUIRE(app.get_bypass_dnd().get() == false);
    }

    SECTION("Wrong stored type is an error, not a default") {
        AppPreferences app(fresh_store({{"bypass_dnd", 1.0f}}));
        REQUIRE_THROWS_AS(app.get_bypass_dnd().get(), PreferenceTypeError);
        REQUIRE_THROWS_AS(app.bypass_dnd_flow().next(), PreferenceTypeError);
    }

    SECTION("Closed store rejects reads and writes") {
        auto store = fresh_store();
        AppPreferences app(store);
        store->close();
        REQUIRE_THROWS_AS(app.get_delivery_reports().get(), StoreError);
        REQUIRE_THROWS_AS(app.set_delivery_reports(true).get(), StoreError);
    }
}

TEST_CASE("AppPreferences through a registry", "[settings][app][registry]") {
    StoreConfig config;
    config.storage = StorageKind::Memory;
    StoreRegistry registry(config);

    AppPreferences first(registry);
    AppPreferences second(registry);

    first.set_mms_auto_download_cellular(true).get();
    REQUIRE(second.get_mms_auto_download_cellular().get() == true);
    REQUIRE(first.accessor().store() == second.accessor().store());
}
