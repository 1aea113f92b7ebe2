#include <prefs/store/preference_store.hpp>
#include <prefs/core/log.hpp>
#include <algorithm>

namespace prefs::store {

namespace {

// Store whose subscribers are being called on this thread, if any
thread_local const PreferenceStore* t_delivering = nullptr;

class DeliveryScope {
public:
    explicit DeliveryScope(const PreferenceStore* store)
        : m_previous(t_delivering) {
        t_delivering = store;
    }
    ~DeliveryScope() { t_delivering = m_previous; }

    DeliveryScope(const DeliveryScope&) = delete;
    DeliveryScope& operator=(const DeliveryScope&) = delete;

private:
    const PreferenceStore* m_previous;
};

} // anonymous namespace

std::shared_ptr<PreferenceStore> PreferenceStore::create(std::string name, std::unique_ptr<IStorageBackend> backend) {
    return std::shared_ptr<PreferenceStore>(new PreferenceStore(std::move(name), std::move(backend)));
}

PreferenceStore::PreferenceStore(std::string name, std::unique_ptr<IStorageBackend> backend)
    : m_name(std::move(name))
    , m_backend(std::move(backend)) {}

PreferenceStore::~PreferenceStore() {
    close();
}

// ============================================================================
// Read
// ============================================================================

PreferenceStore::SnapshotPtr PreferenceStore::data() {
    check_not_delivering();
    std::lock_guard<std::mutex> lock(m_mutex);
    check_open_locked();
    return ensure_loaded_locked();
}

PreferenceStore::SnapshotPtr PreferenceStore::ensure_loaded_locked() {
    if (m_snapshot) {
        return m_snapshot;
    }

    try {
        m_snapshot = std::make_shared<const Preferences>(m_backend->read());
    } catch (const StoreError& e) {
        core::log(core::LogLevel::Error, "[PreferenceStore] Failed to load '{}': {}", m_name, e.what());
        throw;
    }

    core::log(core::LogLevel::Info, "[PreferenceStore] Loaded '{}' ({} keys) from {}",
        m_name, m_snapshot->size(), m_backend->describe());
    return m_snapshot;
}

// ============================================================================
// Subscription
// ============================================================================

core::ScopedConnection PreferenceStore::subscribe(SnapshotCallback on_next, CloseCallback on_close) {
    check_not_delivering();
    std::lock_guard<std::mutex> lock(m_mutex);
    check_open_locked();
    SnapshotPtr current = ensure_loaded_locked();

    uint64_t id = m_next_subscriber_id++;
    {
        DeliveryScope delivering(this);
        on_next(current);
    }
    m_subscribers.push_back({id, std::move(on_next), std::move(on_close)});

    std::weak_ptr<PreferenceStore> weak_self = weak_from_this();
    return core::ScopedConnection([weak_self, id]() {
        if (auto self = weak_self.lock()) {
            self->unsubscribe(id);
        }
    });
}

void PreferenceStore::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.erase(
        std::remove_if(m_subscribers.begin(), m_subscribers.end(),
            [id](const Subscriber& s) { return s.id == id; }),
        m_subscribers.end()
    );
}

void PreferenceStore::publish_locked(const SnapshotPtr& snapshot) {
    DeliveryScope delivering(this);
    for (const auto& subscriber : m_subscribers) {
        try {
            subscriber.on_next(snapshot);
        } catch (const std::exception& e) {
            core::log(core::LogLevel::Error, "[PreferenceStore] Subscriber {} of '{}' threw: {}",
                subscriber.id, m_name, e.what());
        }
    }
}

size_t PreferenceStore::subscriber_count() const {
    check_not_delivering();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

// ============================================================================
// Write
// ============================================================================

PreferenceStore::SnapshotPtr PreferenceStore::update_data(const Transform& transform) {
    check_not_delivering();
    std::lock_guard<std::mutex> lock(m_mutex);
    check_open_locked();
    SnapshotPtr current = ensure_loaded_locked();

    MutablePreferences working = current->to_mutable();
    transform(working);
    auto next = std::make_shared<const Preferences>(working.to_preferences());

    if (*next == *current) {
        return current;
    }

    try {
        m_backend->write(next->values());
    } catch (const StoreError& e) {
        core::log(core::LogLevel::Error, "[PreferenceStore] Failed to write '{}': {}", m_name, e.what());
        throw;
    }

    m_snapshot = next;
    core::log(core::LogLevel::Debug, "[PreferenceStore] Committed '{}' ({} keys)", m_name, next->size());
    publish_locked(next);
    return next;
}

std::future<PreferenceStore::SnapshotPtr> PreferenceStore::edit(Transform transform) {
    auto self = shared_from_this();
    return std::async(std::launch::async, [self, transform = std::move(transform)]() {
        return self->update_data(transform);
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

void PreferenceStore::close() {
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        m_closed = true;
        subscribers.swap(m_subscribers);
    }

    for (const auto& subscriber : subscribers) {
        if (subscriber.on_close) {
            subscriber.on_close();
        }
    }

    core::log(core::LogLevel::Debug, "[PreferenceStore] Closed '{}'", m_name);
}

bool PreferenceStore::is_closed() const {
    check_not_delivering();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

void PreferenceStore::check_open_locked() const {
    if (m_closed) {
        throw StoreError("Preference store '" + m_name + "' is closed");
    }
}

void PreferenceStore::check_not_delivering() const {
    if (t_delivering == this) {
        throw StoreError("Preference store '" + m_name + "' called from one of its own subscribers");
    }
}

} // namespace prefs::store
