#include "devicename/config.hpp"
#include "devicename/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace devicename {

namespace {

std::optional<bool> parse_bool(const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on")
        return true;
    if (value.empty() || value == "0" || value == "false" || value == "no" || value == "off")
        return false;
    return std::nullopt;
}

std::optional<int> parse_int(const std::string& value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Reported once by the caller, not logged here
Result<void> config_error(const std::string& message) {
    return Result<void>::error(ErrorCode::ConfigError, message);
}

}  // namespace

Result<void> apply_config_json(const nlohmann::json& j, Config& config) {
    if (!j.is_object()) {
        return config_error("Config must be a JSON object");
    }

    try {
        if (j.contains("suffix_digit_count")) {
            config.suffix_digit_count = j.at("suffix_digit_count").get<int>();
        }
        if (j.contains("dry_run")) {
            config.dry_run = j.at("dry_run").get<bool>();
        }
        if (j.contains("log_level")) {
            config.log_level = j.at("log_level").get<std::string>();
        }
        if (j.contains("model_identifier")) {
            config.model_override = j.at("model_identifier").get<std::string>();
        }
        if (j.contains("hardware_uuid")) {
            config.uuid_override = j.at("hardware_uuid").get<std::string>();
        }
        if (j.contains("dmi_path")) {
            config.dmi_path = j.at("dmi_path").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return config_error(std::string("Invalid config value: ") + e.what());
    }

    return Result<void>::ok();
}

Result<Config> load_config_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return Result<Config>::error(ErrorCode::ConfigError, "Config file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::error(ErrorCode::ConfigError, "Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Config>::error(ErrorCode::ConfigError,
                                     "Failed to parse " + path + ": " + e.what());
    }

    Config config;
    auto applied = apply_config_json(j, config);
    if (applied.is_error()) {
        return Result<Config>::error(applied.error_code(), path + ": " + applied.error_message());
    }

    DEVICENAME_LOG(debug) << "Loaded config from " << path;
    return Result<Config>::ok(std::move(config));
}

Result<void> apply_environment(Config& config) {
    if (const char* digits = std::getenv(ENV_SUFFIX_DIGITS)) {
        auto parsed = parse_int(digits);
        if (!parsed) {
            return config_error(std::string(ENV_SUFFIX_DIGITS) + " is not an integer: " + digits);
        }
        config.suffix_digit_count = *parsed;
    }

    if (const char* dry_run = std::getenv(ENV_DRY_RUN)) {
        auto parsed = parse_bool(dry_run);
        if (!parsed) {
            return config_error(std::string(ENV_DRY_RUN) + " is not a boolean: " + dry_run);
        }
        config.dry_run = *parsed;
    }

    if (const char* level = std::getenv(ENV_LOG_LEVEL)) {
        config.log_level = level;
    }

    return Result<void>::ok();
}

Result<void> validate_config(const Config& config) {
    if (config.suffix_digit_count < 1) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "suffix_digit_count must be positive, got " +
                                       std::to_string(config.suffix_digit_count));
    }

    if (!parse_log_level(config.log_level)) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "Unknown log level: " + config.log_level);
    }

    return Result<void>::ok();
}

}  // namespace devicename
