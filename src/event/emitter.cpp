/// @file emitter.cpp
/// @brief Emitter implementation

#include <herald/event/emitter.hpp>
#include <herald/core/log.hpp>

#include <algorithm>

namespace herald_event {

// =============================================================================
// Registration
// =============================================================================

Emitter& Emitter::add_listener(const EventKey& key, Listener listener, Context context, bool once) {
    if (!listener.is_invocable()) {
        herald_core::Error error = herald_core::ListenerError::not_invocable();
        error.with_context("event", to_string(key));
        herald_core::debug::record_error(error);
        throw herald_core::Exception(std::move(error));
    }

    auto record = std::make_shared<const ListenerRecord>(
        ListenerRecord{std::move(listener), context, once});

    auto [it, inserted] = m_events.try_emplace(key);
    if (inserted) {
        it->second.sequence = m_next_sequence++;
    }
    it->second.bucket.push_back(std::move(record));

    auto logger = herald_core::event_logger();
    if (logger->should_log(spdlog::level::trace)) {
        logger->trace("Added {}listener for '{}' ({} registered)",
                      once ? "once " : "", to_string(key), it->second.bucket.size());
    }

    check_listener_limit(key, it->second);
    return *this;
}

void Emitter::check_listener_limit(const EventKey& key, Entry& entry) {
    if (m_config.max_listeners == 0 || entry.warned) {
        return;
    }
    if (entry.bucket.size() > m_config.max_listeners) {
        entry.warned = true;
        herald_core::event_logger()->warn(
            "Possible listener leak detected: {} listeners added for '{}' (limit {})",
            entry.bucket.size(), to_string(key), m_config.max_listeners);
    }
}

// =============================================================================
// Dispatch
// =============================================================================

bool Emitter::emit_args(const EventKey& key, const Arguments& args) {
    auto it = m_events.find(key);
    if (it == m_events.end()) {
        return false;
    }

    // Listeners may add or remove records while running
    const std::vector<RecordPtr> records = it->second.bucket.snapshot();
    const Context self = self_context();

    auto logger = herald_core::event_logger();
    if (logger->should_log(spdlog::level::trace)) {
        logger->trace("Emitting '{}' to {} listener(s) with {} argument(s)",
                      to_string(key), records.size(), args.size());
    }

    for (const auto& record : records) {
        if (record->once && !claim_once(key, record.get())) {
            continue;
        }
        record->listener(record->receiver(self), args);
    }

    return true;
}

bool Emitter::claim_once(const EventKey& key, const ListenerRecord* record) {
    auto it = m_events.find(key);
    if (it == m_events.end()) {
        return false;
    }
    if (!it->second.bucket.erase(record)) {
        return false;
    }
    if (it->second.bucket.empty()) {
        m_events.erase(it);
    }
    return true;
}

// =============================================================================
// Removal
// =============================================================================

Emitter& Emitter::remove_listener(const EventKey& key) {
    if (m_events.erase(key) > 0) {
        herald_core::event_logger()->trace("Removed all listeners for '{}'", to_string(key));
    }
    return *this;
}

Emitter& Emitter::remove_listener(const EventKey& key, const Listener& listener,
                                  Context context, bool once_only) {
    auto it = m_events.find(key);
    if (it == m_events.end()) {
        return *this;
    }

    const Context self = self_context();
    std::size_t removed = it->second.bucket.remove_if(
        [&](const ListenerRecord& record) {
            return record.matches(listener, context, once_only, self);
        });

    if (it->second.bucket.empty()) {
        m_events.erase(it);
    }

    if (removed > 0) {
        herald_core::event_logger()->trace("Removed {} listener(s) for '{}'", removed, to_string(key));
    }
    return *this;
}

Emitter& Emitter::remove_all_listeners() {
    if (!m_events.empty()) {
        herald_core::event_logger()->debug("Clearing {} event(s)", m_events.size());
    }
    m_events.clear();
    return *this;
}

Emitter& Emitter::remove_all_listeners(const EventKey& key) {
    return remove_listener(key);
}

// =============================================================================
// Queries
// =============================================================================

std::vector<EventKey> Emitter::event_names() const {
    std::vector<const std::pair<const EventKey, Entry>*> present;
    present.reserve(m_events.size());
    for (const auto& entry : m_events) {
        present.push_back(&entry);
    }

    std::sort(present.begin(), present.end(), [](const auto* a, const auto* b) {
        if (a->first.is_symbol() != b->first.is_symbol()) {
            return !a->first.is_symbol();
        }
        return a->second.sequence < b->second.sequence;
    });

    std::vector<EventKey> names;
    names.reserve(present.size());
    for (const auto* entry : present) {
        names.push_back(entry->first);
    }
    return names;
}

std::vector<Listener> Emitter::listeners(const EventKey& key) const {
    std::vector<Listener> result;
    auto it = m_events.find(key);
    if (it == m_events.end()) {
        return result;
    }

    result.reserve(it->second.bucket.size());
    it->second.bucket.for_each([&result](const ListenerRecord& record) {
        result.push_back(record.listener);
    });
    return result;
}

std::size_t Emitter::listener_count(const EventKey& key) const {
    auto it = m_events.find(key);
    return it == m_events.end() ? 0 : it->second.bucket.size();
}

} // namespace herald_event
