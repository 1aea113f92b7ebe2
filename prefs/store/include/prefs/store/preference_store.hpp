#pragma once

#include <prefs/core/scoped_connection.hpp>
#include <prefs/store/preferences.hpp>
#include <prefs/store/storage_backend.hpp>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace prefs::store {

// ============================================================================
// PreferenceStore
// ============================================================================
//
// Durable typed key-value store with immutable snapshots.
//
//   auto store = PreferenceStore::create("app_preferences",
//                                        std::make_unique<JsonFileBackend>(path));
//   bool on = store->data()->get(bool_key("bypass_dnd")).value_or(false);
//   store->edit([](MutablePreferences& p) { p.set(bool_key("bypass_dnd"), true); }).get();
//
// Load, edits and subscriber registration are serialized by one mutex and
// notifications are delivered while it is held, so every subscriber observes
// snapshots in commit order. Callbacks must not call back into the same store.
//
// ============================================================================

class PreferenceStore : public std::enable_shared_from_this<PreferenceStore> {
public:
    using SnapshotPtr = std::shared_ptr<const Preferences>;
    using Transform = std::function<void(MutablePreferences&)>;
    using SnapshotCallback = std::function<void(const SnapshotPtr&)>;
    using CloseCallback = std::function<void()>;

    static std::shared_ptr<PreferenceStore> create(std::string name, std::unique_ptr<IStorageBackend> backend);

    ~PreferenceStore();

    // Non-copyable
    PreferenceStore(const PreferenceStore&) = delete;
    PreferenceStore& operator=(const PreferenceStore&) = delete;

    const std::string& name() const { return m_name; }

    // Current snapshot. Loads the backend on first use.
    SnapshotPtr data();

    // Delivers the current snapshot immediately, then every committed snapshot.
    // on_close runs once when the store closes. Destroying the returned
    // connection unsubscribes.
    // NOTE: on_next runs with the store locked. Calling data(), subscribe()
    // or update_data() on the same store from inside it throws StoreError;
    // disconnecting from inside it deadlocks.
    core::ScopedConnection subscribe(SnapshotCallback on_next, CloseCallback on_close = nullptr);

    // Transactional read-modify-write. The snapshot is only replaced after the
    // backend write succeeded; a transform that changes nothing writes nothing.
    SnapshotPtr update_data(const Transform& transform);

    // update_data on a background task
    std::future<SnapshotPtr> edit(Transform transform);

    // Ends every subscription. Further calls throw StoreError.
    void close();
    bool is_closed() const;

    size_t subscriber_count() const;

private:
    PreferenceStore(std::string name, std::unique_ptr<IStorageBackend> backend);

    SnapshotPtr ensure_loaded_locked();
    void publish_locked(const SnapshotPtr& snapshot);
    void unsubscribe(uint64_t id);
    void check_open_locked() const;
    void check_not_delivering() const;

    struct Subscriber {
        uint64_t id;
        SnapshotCallback on_next;
        CloseCallback on_close;
    };

    std::string m_name;
    std::unique_ptr<IStorageBackend> m_backend;

    mutable std::mutex m_mutex;
    SnapshotPtr m_snapshot;  // null until first load
    bool m_closed = false;
    std::vector<Subscriber> m_subscribers;
    uint64_t m_next_subscriber_id = 1;
};

} // namespace prefs::store
