/// @file config.cpp
/// @brief JSON configuration helpers for herald_core

#include <herald/core/config.hpp>
#include <cstdint>
#include <fstream>
#include <utility>

namespace herald_core {

namespace {

/// Read an optional non-negative integer field
Result<void> read_size(const nlohmann::json& j, const char* key, std::size_t& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned() &&
        (!value.is_number_integer() || value.get<std::int64_t>() < 0)) {
        return Err(ConfigError::invalid_value(key, "expected a non-negative integer"));
    }
    out = value.get<std::size_t>();
    return Ok();
}

/// Read an optional boolean field
Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_boolean()) {
        return Err(ConfigError::invalid_value(key, "expected a boolean"));
    }
    out = value.get<bool>();
    return Ok();
}

} // anonymous namespace

Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        core_logger()->debug("Config file {} could not be opened", path.string());
        return Err<nlohmann::json>(ConfigError::read_failed(path.string()));
    }

    try {
        auto document = nlohmann::json::parse(file);
        core_logger()->debug("Loaded config file {}", path.string());
        return Ok(std::move(document));
    } catch (const nlohmann::json::parse_error& e) {
        core_logger()->warn("Config file {} is not valid JSON: {}", path.string(), e.what());
        return Err<nlohmann::json>(ConfigError::parse_failed(path.string(), e.what()));
    }
}

Result<LogConfig> log_config_from_json(const nlohmann::json& j) {
    LogConfig config;

    if (!j.is_object()) {
        return Err<LogConfig>(ConfigError::invalid_value("log", "expected an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err<LogConfig>(ConfigError::invalid_value("level", "expected a string"));
        }
        auto name = j["level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Err<LogConfig>(ConfigError::invalid_value("level", "unknown log level '" + name + "'"));
        }
        config.level = *level;
    }

    if (auto r = read_bool(j, "console", config.console_enabled); !r) {
        return Err<LogConfig>(r.error());
    }
    if (auto r = read_bool(j, "file", config.file_enabled); !r) {
        return Err<LogConfig>(r.error());
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Err<LogConfig>(ConfigError::invalid_value("directory", "expected a string"));
        }
        config.log_directory = j["directory"].get<std::string>();
    }

    if (auto r = read_size(j, "max_file_size", config.max_file_size); !r) {
        return Err<LogConfig>(r.error());
    }
    if (auto r = read_size(j, "max_files", config.max_files); !r) {
        return Err<LogConfig>(r.error());
    }

    return Ok(config);
}

} // namespace herald_core
