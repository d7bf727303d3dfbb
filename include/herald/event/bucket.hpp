#pragma once

/// @file bucket.hpp
/// @brief Ordered listener storage for a single event key

#include "fwd.hpp"
#include "listener.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace herald_event {

/// Records registered under one key, in registration order
///
/// Storage is compact: nothing, a single record, or a vector once a second
/// record arrives. The layout is an implementation detail; every accessor
/// presents the same ordered sequence regardless of it.
class Bucket {
public:
    /// Current storage layout
    enum class Layout : std::uint8_t {
        Empty,
        Single,
        Many
    };

    Bucket() = default;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] Layout layout() const noexcept;

    /// Append a record
    void push_back(RecordPtr record);

    /// Copy of the record handles, in order
    [[nodiscard]] std::vector<RecordPtr> snapshot() const;

    /// Remove exactly this record (by identity); false if it is not present
    bool erase(const ListenerRecord* record);

    /// Remove every record matching `pred`, keeping survivors in order
    /// @return Number of records removed
    template<typename Pred>
    std::size_t remove_if(Pred pred) {
        std::size_t removed = 0;
        if (auto* single = std::get_if<RecordPtr>(&m_storage)) {
            if (pred(static_cast<const ListenerRecord&>(**single))) {
                m_storage = std::monostate{};
                removed = 1;
            }
        } else if (auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
            removed = std::erase_if(*many, [&pred](const RecordPtr& record) {
                return pred(static_cast<const ListenerRecord&>(*record));
            });
            normalize();
        }
        return removed;
    }

    /// Visit records in order
    template<typename F>
    void for_each(F&& fn) const {
        if (const auto* single = std::get_if<RecordPtr>(&m_storage)) {
            fn(static_cast<const ListenerRecord&>(**single));
        } else if (const auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
            for (const auto& record : *many) {
                fn(static_cast<const ListenerRecord&>(*record));
            }
        }
    }

private:
    /// Collapse a vector of one record to Single, and of none to Empty
    void normalize();

    std::variant<std::monostate, RecordPtr, std::vector<RecordPtr>> m_storage;
};

} // namespace herald_event
