/// @file config.cpp
/// @brief Emitter configuration loading

#include <herald/event/config.hpp>
#include <herald/core/config.hpp>
#include <herald/core/log.hpp>

#include <cstdint>

namespace herald_event {

herald_core::Result<EmitterConfig> emitter_config_from_json(const nlohmann::json& j) {
    EmitterConfig config;

    if (!j.is_object()) {
        return herald_core::Err<EmitterConfig>(
            herald_core::ConfigError::invalid_value("emitter", "expected an object"));
    }

    if (j.contains("max_listeners")) {
        const auto& value = j["max_listeners"];
        if (!value.is_number_unsigned() &&
            (!value.is_number_integer() || value.get<std::int64_t>() < 0)) {
            return herald_core::Err<EmitterConfig>(
                herald_core::ConfigError::invalid_value("max_listeners", "expected a non-negative integer"));
        }
        config.max_listeners = value.get<std::size_t>();
    }

    return herald_core::Ok(config);
}

herald_core::Result<EmitterConfig> load_emitter_config(const std::filesystem::path& path) {
    auto document = herald_core::read_json_file(path);
    if (!document) {
        herald_core::debug::record_error(document.error());
        return herald_core::Err<EmitterConfig>(document.error());
    }

    if (!document->is_object() || !document->contains("emitter")) {
        herald_core::event_logger()->debug("No emitter section in {}, using defaults", path.string());
        return herald_core::Ok(EmitterConfig{});
    }

    auto config = emitter_config_from_json((*document)["emitter"]);
    if (!config) {
        config.error().with_context("file", path.string());
        herald_core::debug::record_error(config.error());
    }
    return config;
}

} // namespace herald_event
