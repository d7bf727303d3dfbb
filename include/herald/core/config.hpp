#pragma once

/// @file config.hpp
/// @brief JSON-backed configuration helpers for herald_core

#include "error.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace herald_core {

/// Read and parse a JSON document from disk
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/// Build a LogConfig from a JSON object
///
/// Recognized keys: `level`, `console`, `file`, `directory`,
/// `max_file_size`, `max_files`. Missing keys keep their defaults.
[[nodiscard]] Result<LogConfig> log_config_from_json(const nlohmann::json& j);

} // namespace herald_core
