/// @file key.cpp
/// @brief EventKey and Symbol implementation

#include <herald/event/key.hpp>
#include <atomic>

namespace herald_event {

namespace {

/// Process-wide symbol id source; 0 is never handed out
std::atomic<std::uint64_t> s_next_symbol_id{1};

} // anonymous namespace

Symbol Symbol::create(std::string description) {
    std::uint64_t id = s_next_symbol_id.fetch_add(1, std::memory_order_relaxed);
    return Symbol(id, std::make_shared<const std::string>(std::move(description)));
}

std::size_t EventKey::hash() const noexcept {
    if (const auto* name = text()) {
        return std::hash<std::string>{}(*name);
    }
    // Keep symbol hashes apart from text hashes of the same numeric value
    constexpr std::size_t k_symbol_salt = static_cast<std::size_t>(0x9e3779b97f4a7c15ULL);
    return std::hash<std::uint64_t>{}(symbol()->id()) ^ k_symbol_salt;
}

std::string to_string(const EventKey& key) {
    if (const auto* name = key.text()) {
        return *name;
    }
    return "Symbol(" + key.symbol()->description() + ")";
}

} // namespace herald_event
