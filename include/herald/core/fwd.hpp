#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for herald_core module

#include <cstdint>

namespace herald_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ListenerError;
struct ConfigError;
class Error;
class Exception;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace herald_core
