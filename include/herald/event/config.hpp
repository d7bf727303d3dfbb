#pragma once

/// @file config.hpp
/// @brief Emitter configuration

#include "fwd.hpp"
#include <herald/core/error.hpp>

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace herald_event {

/// Emitter tuning options
struct EmitterConfig {
    /// Listener count per key above which a leak warning is logged (0 = never)
    std::size_t max_listeners = 0;
};

/// Build an EmitterConfig from the `emitter` object of a config document
[[nodiscard]] herald_core::Result<EmitterConfig> emitter_config_from_json(const nlohmann::json& j);

/// Load the `emitter` section of a JSON config file; a file without one
/// yields the defaults
[[nodiscard]] herald_core::Result<EmitterConfig> load_emitter_config(const std::filesystem::path& path);

} // namespace herald_event
