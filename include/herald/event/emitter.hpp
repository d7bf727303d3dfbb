#pragma once

/// @file emitter.hpp
/// @brief Synchronous listener registry
///
/// Listeners are registered under an EventKey and invoked in registration
/// order, on the caller's thread, when the key is emitted. No internal
/// locking is done; callers serialize access to a given Emitter.

#include "fwd.hpp"
#include "bucket.hpp"
#include "config.hpp"
#include "key.hpp"
#include "listener.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace herald_event {

/// Registry of listeners keyed by event
class Emitter {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create an empty emitter
    Emitter() = default;

    /// Create an empty emitter with options
    explicit Emitter(EmitterConfig config) : m_config(config) {}

    // Non-copyable
    Emitter(const Emitter&) = delete;
    Emitter& operator=(const Emitter&) = delete;

    // Movable
    Emitter(Emitter&&) = default;
    Emitter& operator=(Emitter&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register `listener` under `key`
    ///
    /// The listener runs with `context` as its receiver, or with this emitter
    /// when no context is given. Registering the same listener twice creates
    /// two independent records.
    ///
    /// @throws herald_core::Exception (InvalidArgument) if the listener is
    ///         not invocable; nothing is registered in that case
    Emitter& add_listener(const EventKey& key, Listener listener, Context context = {}, bool once = false);

    /// Register a listener that stays until removed
    Emitter& on(const EventKey& key, Listener listener, Context context = {}) {
        return add_listener(key, std::move(listener), context, false);
    }

    /// Register a listener that is removed the first time it is selected
    Emitter& once(const EventKey& key, Listener listener, Context context = {}) {
        return add_listener(key, std::move(listener), context, true);
    }

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Invoke every listener registered under `key` with `args`
    /// @return false if nothing was registered under `key`
    template<typename... A>
    bool emit(const EventKey& key, A&&... args) {
        return emit_args(key, detail::make_arguments(std::forward<A>(args)...));
    }

    /// Invoke every listener registered under `key` with a prepared pack
    ///
    /// Listeners run in registration order over the records present when
    /// the call starts. A once record is taken out of the registry right
    /// before it runs, and is skipped if it was already taken out. An
    /// exception thrown by a listener leaves this call immediately.
    bool emit_args(const EventKey& key, const Arguments& args);

    // =========================================================================
    // Removal
    // =========================================================================

    /// Remove every listener under `key`
    Emitter& remove_listener(const EventKey& key);

    /// Remove the records of `listener` under `key`, optionally limited to
    /// those bound to `context` and to once records
    Emitter& remove_listener(const EventKey& key, const Listener& listener,
                             Context context = {}, bool once_only = false);

    Emitter& off(const EventKey& key) {
        return remove_listener(key);
    }

    Emitter& off(const EventKey& key, const Listener& listener,
                 Context context = {}, bool once_only = false) {
        return remove_listener(key, listener, context, once_only);
    }

    /// Remove every listener of every key
    Emitter& remove_all_listeners();

    /// Remove every listener under `key`
    Emitter& remove_all_listeners(const EventKey& key);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Keys with at least one listener: textual keys, then symbols, each in
    /// order of first registration
    ///
    /// Integer-like names such as "2" are ordinary textual keys here and get
    /// no numeric ordering ahead of other names.
    [[nodiscard]] std::vector<EventKey> event_names() const;

    /// Listeners under `key` in dispatch order
    [[nodiscard]] std::vector<Listener> listeners(const EventKey& key) const;

    /// Number of records under `key`
    [[nodiscard]] std::size_t listener_count(const EventKey& key) const;

    /// Number of keys with at least one listener
    [[nodiscard]] std::size_t event_count() const noexcept { return m_events.size(); }

    [[nodiscard]] bool empty() const noexcept { return m_events.empty(); }

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const EmitterConfig& config() const noexcept { return m_config; }

    [[nodiscard]] std::size_t max_listeners() const noexcept { return m_config.max_listeners; }

    /// Set the leak warning threshold (0 disables it)
    Emitter& set_max_listeners(std::size_t count) {
        m_config.max_listeners = count;
        return *this;
    }

private:
    struct Entry {
        Bucket bucket;
        std::uint64_t sequence = 0;  // Order of first registration
        bool warned = false;         // Leak warning already logged
    };

    /// Receiver used by records registered without a context
    [[nodiscard]] Context self_context() noexcept { return Context::of(*this); }

    /// Take a once record out of live storage; false if it is already gone
    bool claim_once(const EventKey& key, const ListenerRecord* record);

    void check_listener_limit(const EventKey& key, Entry& entry);

    std::unordered_map<EventKey, Entry, EventKeyHash> m_events;
    std::uint64_t m_next_sequence = 0;
    EmitterConfig m_config;
};

} // namespace herald_event
