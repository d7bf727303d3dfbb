/// @file bucket.cpp
/// @brief Bucket implementation

#include <herald/event/bucket.hpp>

#include <algorithm>

namespace herald_event {

bool Bucket::empty() const noexcept {
    return std::holds_alternative<std::monostate>(m_storage);
}

std::size_t Bucket::size() const noexcept {
    if (std::holds_alternative<RecordPtr>(m_storage)) {
        return 1;
    }
    if (const auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
        return many->size();
    }
    return 0;
}

Bucket::Layout Bucket::layout() const noexcept {
    switch (m_storage.index()) {
        case 1: return Layout::Single;
        case 2: return Layout::Many;
        default: return Layout::Empty;
    }
}

void Bucket::push_back(RecordPtr record) {
    if (auto* single = std::get_if<RecordPtr>(&m_storage)) {
        std::vector<RecordPtr> many;
        many.reserve(2);
        many.push_back(std::move(*single));
        many.push_back(std::move(record));
        m_storage = std::move(many);
    } else if (auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
        many->push_back(std::move(record));
    } else {
        m_storage = std::move(record);
    }
}

std::vector<RecordPtr> Bucket::snapshot() const {
    if (const auto* single = std::get_if<RecordPtr>(&m_storage)) {
        return {*single};
    }
    if (const auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
        return *many;
    }
    return {};
}

bool Bucket::erase(const ListenerRecord* record) {
    if (auto* single = std::get_if<RecordPtr>(&m_storage)) {
        if (single->get() != record) {
            return false;
        }
        m_storage = std::monostate{};
        return true;
    }

    if (auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage)) {
        auto it = std::find_if(many->begin(), many->end(),
            [record](const RecordPtr& candidate) {
                return candidate.get() == record;
            });
        if (it == many->end()) {
            return false;
        }
        many->erase(it);
        normalize();
        return true;
    }

    return false;
}

void Bucket::normalize() {
    auto* many = std::get_if<std::vector<RecordPtr>>(&m_storage);
    if (!many) {
        return;
    }
    if (many->empty()) {
        m_storage = std::monostate{};
    } else if (many->size() == 1) {
        RecordPtr last = std::move(many->front());
        m_storage = std::move(last);
    }
}

} // namespace herald_event
