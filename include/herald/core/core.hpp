#pragma once

/// @file core.hpp
/// @brief Main include file for herald_core module
///
/// herald_core provides the shared infrastructure of herald:
///
/// - **Error Handling**: Error, Result<T> and Exception
/// - **Logging**: spdlog-backed named loggers
/// - **Configuration**: JSON config files via nlohmann/json

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
