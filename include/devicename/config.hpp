#pragma once

/**
 * @file config.hpp
 * @brief Configuration loading for devicename
 *
 * Settings are layered: defaults, then an optional JSON file, then
 * environment variables, then the command line.
 */

#include "devicename/devicename.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace devicename {

/// Environment variable overriding Config::suffix_digit_count
constexpr const char* ENV_SUFFIX_DIGITS = "DEVICENAME_SUFFIX_DIGITS";

/// Environment variable overriding Config::dry_run
constexpr const char* ENV_DRY_RUN = "DEVICENAME_DRY_RUN";

/// Environment variable overriding Config::log_level
constexpr const char* ENV_LOG_LEVEL = "DEVICENAME_LOG_LEVEL";

/**
 * @brief Apply the keys of a JSON object onto @p config
 *
 * Recognised keys: suffix_digit_count, dry_run, log_level, model_identifier,
 * hardware_uuid, dmi_path. Unknown keys are ignored.
 *
 * @return ConfigError if @p j is not an object or a key has the wrong type
 */
[[nodiscard]] Result<void> apply_config_json(const nlohmann::json& j, Config& config);

/**
 * @brief Load a JSON config file on top of the defaults
 *
 * @return The merged config, or ConfigError if the file cannot be read or parsed
 */
[[nodiscard]] Result<Config> load_config_file(const std::string& path);

/**
 * @brief Apply DEVICENAME_* environment variables onto @p config
 *
 * @return ConfigError if a variable holds an unparseable value
 */
[[nodiscard]] Result<void> apply_environment(Config& config);

/**
 * @brief Check a fully merged config
 *
 * @return ConfigError if the digit count is not positive or the log level is unknown
 */
[[nodiscard]] Result<void> validate_config(const Config& config);

}  // namespace devicename
