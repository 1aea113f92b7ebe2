#pragma once

#include <prefs/core/scoped_connection.hpp>
#include <prefs/store/preference_store.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace prefs::store {

// ============================================================================
// ValueStream - cancellable, conflated view of one value derived from a store
// ============================================================================
//
// The first value reflects the store at construction time. Afterwards a value
// is queued whenever a committed snapshot maps to something different from the
// last value seen; an unread value is replaced by a newer one (latest wins).
//
// The stream ends when the store closes or cancel() is called. A failure to
// subscribe, or an exception thrown by the mapper (e.g. PreferenceTypeError),
// ends the stream and is rethrown by the next read.
//
// ============================================================================

template<typename T>
class ValueStream {
public:
    using Mapper = std::function<T(const Preferences&)>;

    ValueStream(const std::shared_ptr<PreferenceStore>& store, Mapper mapper)
        : m_state(std::make_shared<State>(std::move(mapper))) {
        auto state = m_state;
        try {
            m_connection = store->subscribe(
                [state](const PreferenceStore::SnapshotPtr& snapshot) { state->on_snapshot(*snapshot); },
                [state]() { state->on_close(); }
            );
        } catch (...) {
            state->fail(std::current_exception());
        }
    }

    ~ValueStream() = default;

    ValueStream(ValueStream&&) noexcept = default;
    ValueStream& operator=(ValueStream&&) noexcept = default;
    ValueStream(const ValueStream&) = delete;
    ValueStream& operator=(const ValueStream&) = delete;

    // Blocks until a value is available. std::nullopt once the stream has ended.
    std::optional<T> next() {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cv.wait(lock, [this] { return m_state->ready(); });
        return m_state->take();
    }

    // Like next(), giving up after `timeout` with std::nullopt.
    template<typename Rep, typename Period>
    std::optional<T> next_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        if (!m_state->cv.wait_for(lock, timeout, [this] { return m_state->ready(); })) {
            return std::nullopt;
        }
        return m_state->take();
    }

    // Non-blocking read of the pending value, if any.
    std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->take();
    }

    // Stops emissions and releases the store subscription.
    void cancel() {
        m_connection.disconnect();
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->closed = true;
            m_state->pending.reset();
        }
        m_state->cv.notify_all();
    }

    // True once the stream has ended and no value is left to read.
    bool is_closed() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->closed && !m_state->pending;
    }

private:
    struct State {
        explicit State(Mapper fn) : mapper(std::move(fn)) {}

        void on_snapshot(const Preferences& snapshot) {
            std::optional<T> value;
            std::exception_ptr failure;
            try {
                value = mapper(snapshot);
            } catch (...) {
                failure = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                if (closed) return;
                if (failure) {
                    error = failure;
                    closed = true;
                } else {
                    if (last_seen && *last_seen == *value) return;
                    last_seen = value;
                    pending = std::move(value);
                }
            }
            cv.notify_all();
        }

        void on_close() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                closed = true;
            }
            cv.notify_all();
        }

        void fail(std::exception_ptr failure) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                error = failure;
                closed = true;
            }
            cv.notify_all();
        }

        // Requires mutex
        bool ready() const { return pending.has_value() || closed; }

        // Requires mutex. Pending values drain before an error is reported.
        std::optional<T> take() {
            if (pending) {
                std::optional<T> value = std::move(pending);
                pending.reset();
                return value;
            }
            if (error) {
                std::rethrow_exception(error);
            }
            return std::nullopt;
        }

        Mapper mapper;
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::optional<T> pending;
        std::optional<T> last_seen;
        std::exception_ptr error;
        bool closed = false;
    };

    std::shared_ptr<State> m_state;
    core::ScopedConnection m_connection;
};

} // namespace prefs::store
