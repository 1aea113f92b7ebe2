// Example: wiring AppPreferences with an explicit StoreRegistry
// Usage: app_preferences_example [config.json]

#include <prefs/core/log.hpp>
#include <prefs/settings/settings.hpp>
#include <prefs/store/store.hpp>
#include <iostream>
#include <thread>

using namespace prefs;

int main(int argc, char** argv) {
    store::StoreConfig config;
    if (argc > 1 && !config.load(argv[1])) {
        core::log(core::LogLevel::Warn, "[Example] Using default store configuration");
    }
    core::set_log_level(config.log_level);

    store::StoreRegistry registry(config);
    settings::AppPreferences app(registry);

    try {
        std::cout << "Delivery reports:        " << app.get_delivery_reports().get() << std::endl;
        std::cout << "MMS auto-download Wi-Fi: " << app.get_mms_auto_download_wifi().get() << std::endl;
        std::cout << "MMS auto-download cell:  " << app.get_mms_auto_download_cellular().get() << std::endl;
        std::cout << "Bypass DND:              " << app.get_bypass_dnd().get() << std::endl;
        std::cout << "Text size scale:         " << app.get_text_size_scale().get() << std::endl;

        // A UI would keep this stream for its lifetime and re-render on each value
        auto scale_flow = app.text_size_scale_flow();
        std::thread watcher([&scale_flow]() {
            try {
                while (auto scale = scale_flow.next()) {
                    std::cout << "  text size scale -> " << *scale << std::endl;
                }
                std::cout << "  text size stream ended" << std::endl;
            } catch (const std::exception& e) {
                core::log(core::LogLevel::Error, "[Example] Text size stream failed: {}", e.what());
            }
        });

        // Stops and joins the watcher on every exit path, including a failed write
        struct WatcherGuard {
            store::ValueStream<float>& flow;
            std::thread& thread;
            ~WatcherGuard() {
                flow.cancel();
                if (thread.joinable()) thread.join();
            }
        } guard{scale_flow, watcher};

        app.set_text_size_scale(1.25f).get();
        app.set_text_size_scale(5.0f).get();  // stored as 1.6

        registry.close_all();
        watcher.join();
    } catch (const std::exception& e) {
        core::log(core::LogLevel::Error, "[Example] Preference access failed: {}", e.what());
        return 1;
    }

    return 0;
}
