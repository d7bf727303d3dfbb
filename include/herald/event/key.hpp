#pragma once

/// @file key.hpp
/// @brief Event keys: textual names and opaque symbols

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace herald_event {

// =============================================================================
// Symbol
// =============================================================================

/// Opaque event token
///
/// Every call to create() yields a new token that compares equal only to its
/// own copies. The description is diagnostic only and plays no part in
/// equality.
class Symbol {
public:
    /// Create a new unique symbol
    [[nodiscard]] static Symbol create(std::string description = {});

    /// Unique token value
    [[nodiscard]] std::uint64_t id() const noexcept { return m_id; }

    /// Description given at creation
    [[nodiscard]] const std::string& description() const noexcept { return *m_description; }

    bool operator==(const Symbol& other) const noexcept { return m_id == other.m_id; }
    bool operator!=(const Symbol& other) const noexcept { return m_id != other.m_id; }

private:
    Symbol(std::uint64_t id, std::shared_ptr<const std::string> description)
        : m_id(id), m_description(std::move(description)) {}

    std::uint64_t m_id;
    std::shared_ptr<const std::string> m_description;
};

// =============================================================================
// EventKey
// =============================================================================

/// Identifies an event: either a textual name or a Symbol
class EventKey {
public:
    EventKey(std::string name) : m_value(std::move(name)) {}
    EventKey(std::string_view name) : m_value(std::string(name)) {}
    EventKey(const char* name) : m_value(std::string(name)) {}
    EventKey(Symbol symbol) : m_value(std::move(symbol)) {}

    [[nodiscard]] bool is_text() const noexcept { return std::holds_alternative<std::string>(m_value); }
    [[nodiscard]] bool is_symbol() const noexcept { return std::holds_alternative<Symbol>(m_value); }

    /// Textual name, or nullptr for symbol keys
    [[nodiscard]] const std::string* text() const noexcept { return std::get_if<std::string>(&m_value); }

    /// Symbol, or nullptr for textual keys
    [[nodiscard]] const Symbol* symbol() const noexcept { return std::get_if<Symbol>(&m_value); }

    /// Hash consistent with operator==
    [[nodiscard]] std::size_t hash() const noexcept;

    bool operator==(const EventKey& other) const noexcept { return m_value == other.m_value; }
    bool operator!=(const EventKey& other) const noexcept { return !(*this == other); }

private:
    std::variant<std::string, Symbol> m_value;
};

/// Human-readable form for logs: the name itself, or `Symbol(description)`
[[nodiscard]] std::string to_string(const EventKey& key);

/// Hasher for unordered containers
struct EventKeyHash {
    std::size_t operator()(const EventKey& key) const noexcept { return key.hash(); }
};

} // namespace herald_event

template<>
struct std::hash<herald_event::EventKey> {
    std::size_t operator()(const herald_event::EventKey& key) const noexcept { return key.hash(); }
};
