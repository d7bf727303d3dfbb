/// @file error.cpp
/// @brief Error handling implementation for herald_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Process-wide error statistics

#include <herald/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>

namespace herald_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format listener error with full context
std::string format_listener_error(const ListenerError& err) {
    std::ostringstream oss;
    oss << "[ListenerError] " << err.message;

    if (err.kind != ListenerError::Kind::NotInvocable) {
        oss << " (argument: " << err.index << ")";
    }
    if (!err.expected.empty()) {
        oss << " (expected: " << err.expected << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ListenerError>) {
            oss << detail::format_listener_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_error_code_count = static_cast<std::size_t>(ErrorCode::ParseError) + 1;

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::array<std::atomic<std::uint64_t>, k_error_code_count> by_code{};
};

ErrorStats s_error_stats;

} // anonymous namespace

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    auto index = static_cast<std::size_t>(error.code());
    if (index < k_error_code_count) {
        s_error_stats.by_code[index].fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    if (index >= k_error_code_count) {
        return 0;
    }
    return s_error_stats.by_code[index].load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s_error_stats.by_code) {
        counter.store(0, std::memory_order_relaxed);
    }
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n";
    for (std::size_t i = 0; i < k_error_code_count; ++i) {
        oss << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": "
            << s_error_stats.by_code[i].load() << "\n";
    }
    return oss.str();
}

} // namespace debug

} // namespace herald_core
